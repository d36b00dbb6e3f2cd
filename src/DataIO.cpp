#include "DataIO.hpp"
#include "AlignmentErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace cellalign {
namespace io {

namespace {

const char* const kStage = "LoadInputs";

std::ifstream openInput(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigurationError("Cannot open input file: " + path, kStage);
    }
    return in;
}

std::ofstream openOutput(const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw ConfigurationError("Cannot open output file: " + path);
    }
    out << std::setprecision(10);
    return out;
}

std::string trim(const std::string& s) {
    size_t begin = 0, end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

// Column positions of the named header fields
std::unordered_map<std::string, size_t> headerIndex(const std::vector<std::string>& header,
                                                    const std::vector<std::string>& required,
                                                    const std::string& path) {
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < header.size(); ++i) {
        index.emplace(header[i], i);
    }
    for (const auto& name : required) {
        if (!index.count(name)) {
            throw DataShapeError("column " + name + " missing from " + path, kStage);
        }
    }
    return index;
}

double parseValue(const std::string& token, const std::string& path, size_t lineNo) {
    std::string t = trim(token);
    if (t.empty() || t == "NA" || t == "NaN" || t == "nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    try {
        size_t used = 0;
        double v = std::stod(t, &used);
        if (used != t.size()) {
            throw std::invalid_argument(t);
        }
        return v;
    } catch (const std::exception&) {
        throw DataShapeError("invalid expression value '" + t + "' on line " + std::to_string(lineNo) +
                             " of " + path, kStage);
    }
}

std::string formatOptional(const std::optional<double>& v) {
    if (!v) return "NA";
    std::ostringstream out;
    out << std::setprecision(10) << *v;
    return out.str();
}

std::string formatOptional(const std::optional<int>& v) {
    return v ? std::to_string(*v) : "NA";
}

std::string formatDouble(double v) {
    if (std::isnan(v)) return "NA";
    std::ostringstream out;
    out << std::setprecision(10) << v;
    return out.str();
}

int parseInt(const std::string& key, const std::string& value) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw ConfigurationError("parameter " + key + " expects an integer, got '" + value + "'");
    }
    return v;
}

double parseDouble(const std::string& key, const std::string& value) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw ConfigurationError("parameter " + key + " expects a number, got '" + value + "'");
    }
    return v;
}

}

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else if (c != '\r') {
            field += c;
        }
    }
    fields.push_back(field);
    return fields;
}

ExpressionMatrix loadExpressionMatrix(const std::string& path) {
    std::ifstream in = openInput(path);

    std::string line;
    if (!std::getline(in, line)) {
        throw DataShapeError("empty expression file: " + path, kStage);
    }
    std::vector<std::string> header = splitCsvLine(line);
    for (auto& h : header) h = trim(h);
    if (header.size() < 2) {
        throw DataShapeError("expression file has no gene columns: " + path, kStage);
    }

    ExpressionMatrix matrix;
    matrix.genes.assign(header.begin() + 1, header.end());
    std::unordered_set<std::string> seen;
    for (const auto& gene : matrix.genes) {
        if (!seen.insert(gene).second) {
            throw DataShapeError("duplicate gene " + gene + " in " + path, kStage);
        }
    }
    seen.clear();

    std::vector<std::vector<double>> rows;
    size_t lineNo = 1;
    while (std::getline(in, line)) {
        ++lineNo;
        if (trim(line).empty()) continue;
        std::vector<std::string> fields = splitCsvLine(line);
        if (fields.size() != header.size()) {
            throw DataShapeError("line " + std::to_string(lineNo) + " of " + path + " has " +
                                 std::to_string(fields.size()) + " fields, expected " +
                                 std::to_string(header.size()), kStage);
        }
        matrix.sampleIds.push_back(trim(fields[0]));
        if (!seen.insert(matrix.sampleIds.back()).second) {
            throw DataShapeError("duplicate sample " + matrix.sampleIds.back() + " in " + path, kStage);
        }
        std::vector<double> row;
        row.reserve(fields.size() - 1);
        for (size_t j = 1; j < fields.size(); ++j) {
            row.push_back(parseValue(fields[j], path, lineNo));
        }
        rows.push_back(std::move(row));
    }

    matrix.values.resize(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(matrix.genes.size()));
    for (size_t i = 0; i < rows.size(); ++i) {
        for (size_t j = 0; j < rows[i].size(); ++j) {
            matrix.values(i, j) = rows[i][j];
        }
    }
    return matrix;
}

std::vector<SampleAnnotation> loadAnnotation(const std::string& path) {
    std::ifstream in = openInput(path);

    std::string line;
    if (!std::getline(in, line)) {
        throw DataShapeError("empty annotation file: " + path, kStage);
    }
    std::vector<std::string> header = splitCsvLine(line);
    for (auto& h : header) h = trim(h);
    auto index = headerIndex(header, {"sampleID", "type"}, path);

    auto field = [&](const std::vector<std::string>& fields, const std::string& name) {
        auto it = index.find(name);
        return it != index.end() && it->second < fields.size() ? trim(fields[it->second]) : std::string();
    };

    std::vector<SampleAnnotation> annotation;
    size_t lineNo = 1;
    while (std::getline(in, line)) {
        ++lineNo;
        if (trim(line).empty()) continue;
        std::vector<std::string> fields = splitCsvLine(line);
        if (fields.size() != header.size()) {
            throw DataShapeError("line " + std::to_string(lineNo) + " of " + path + " has " +
                                 std::to_string(fields.size()) + " fields, expected " +
                                 std::to_string(header.size()), kStage);
        }

        SampleAnnotation row;
        row.sampleId = field(fields, "sampleID");
        std::string type = field(fields, "type");
        if (type == "tumor") {
            row.domain = Domain::TUMOR;
        } else if (type == "CL" || type == "cell_line") {
            row.domain = Domain::CELL_LINE;
        } else {
            throw DataShapeError("unknown sample type '" + type + "' on line " + std::to_string(lineNo) +
                                 " of " + path, kStage);
        }
        row.tissue = field(fields, "tissue");
        row.subtype = field(fields, "subtype");
        row.collectionContext = field(fields, "Primary/Metastasis");
        annotation.push_back(row);
    }
    return annotation;
}

std::vector<GeneReference> loadGeneReference(const std::string& path) {
    std::ifstream in = openInput(path);

    std::string line;
    if (!std::getline(in, line)) {
        throw DataShapeError("empty gene reference file: " + path, kStage);
    }
    std::vector<std::string> header = splitCsvLine(line);
    for (auto& h : header) h = trim(h);
    auto index = headerIndex(header, {"ensembl_gene_id", "symbol", "locus_group"}, path);

    std::vector<GeneReference> reference;
    size_t lineNo = 1;
    while (std::getline(in, line)) {
        ++lineNo;
        if (trim(line).empty()) continue;
        std::vector<std::string> fields = splitCsvLine(line);
        if (fields.size() != header.size()) {
            throw DataShapeError("line " + std::to_string(lineNo) + " of " + path + " has " +
                                 std::to_string(fields.size()) + " fields, expected " +
                                 std::to_string(header.size()), kStage);
        }
        GeneReference entry{
            trim(fields[index["ensembl_gene_id"]]),
            trim(fields[index["symbol"]]),
            trim(fields[index["locus_group"]])
        };
        if (!entry.geneId.empty()) {
            reference.push_back(entry);
        }
    }
    return reference;
}

AlignmentParameters loadParameters(const std::string& path, AlignmentParameters params) {
    std::ifstream in = openInput(path);

    auto toList = [](const std::string& value) {
        std::vector<std::string> items;
        std::istringstream iss(value);
        std::string item;
        while (std::getline(iss, item, ',')) {
            item = trim(item);
            if (!item.empty()) items.push_back(item);
        }
        return items;
    };

    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = trim(line.substr(0, line.find('#')));
        if (line.empty()) continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigurationError("line " + std::to_string(lineNo) + " of " + path + " is not key = value");
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "pc_dims") params.pcDims = parseInt(key, value);
        else if (key == "umap_n_neighbors") params.umapNeighbors = parseInt(key, value);
        else if (key == "umap_min_dist") params.umapMinDist = parseDouble(key, value);
        else if (key == "umap_epochs") params.umapEpochs = parseInt(key, value);
        else if (key == "clustering_method") params.clusteringMethod = value;
        else if (key == "cluster_k") params.clusterNeighbors = parseInt(key, value);
        else if (key == "cluster_resolution") params.clusterResolution = parseDouble(key, value);
        else if (key == "snn_prune") params.snnPruneThreshold = parseDouble(key, value);
        else if (key == "kmeans_clusters") params.kmeansClusters = parseInt(key, value);
        else if (key == "top_de_genes") params.topDEGenes = parseInt(key, value);
        else if (key == "fast_cpca") {
            if (value == "none" || value.empty()) params.fastContrastiveDims.reset();
            else params.fastContrastiveDims = parseInt(key, value);
        }
        else if (key == "remove_cpca_dims") {
            params.removeContrastiveDims.clear();
            for (const auto& item : toList(value)) params.removeContrastiveDims.push_back(parseInt(key, item));
        }
        else if (key == "mnn_k_tumor") params.mnnTargetNeighbors = parseInt(key, value);
        else if (key == "mnn_k_cl") params.mnnReferenceNeighbors = parseInt(key, value);
        else if (key == "mnn_ndist") params.mnnDistanceScale = parseDouble(key, value);
        else if (key == "excluded_locus_groups") params.excludedLocusGroups = toList(value);
        else if (key == "seed") params.randomSeed = static_cast<unsigned int>(parseInt(key, value));
        else if (key == "parallel_domains") params.parallelDomains = (value == "true" || value == "1");
        else throw ConfigurationError("unknown parameter '" + key + "' on line " + std::to_string(lineNo) + " of " + path);
    }
    validateParameters(params);
    return params;
}

void exportMatrix(const ExpressionMatrix& matrix, const std::string& outputFile) {
    std::ofstream out = openOutput(outputFile);

    out << "sampleID";
    for (const auto& gene : matrix.genes) {
        out << "," << gene;
    }
    out << "\n";

    for (Eigen::Index i = 0; i < matrix.values.rows(); ++i) {
        out << matrix.sampleIds[i];
        for (Eigen::Index j = 0; j < matrix.values.cols(); ++j) {
            out << "," << formatDouble(matrix.values(i, j));
        }
        out << "\n";
    }
}

void exportEmbedding(const AlignmentResult& result, const std::string& outputFile) {
    std::ofstream out = openOutput(outputFile);
    const AlignedEmbedding& embedding = result.embedding;
    if (embedding.clusters.labels.size() != result.annotation.size() ||
        static_cast<size_t>(embedding.layout.rows()) != result.annotation.size() ||
        static_cast<size_t>(embedding.pcs.rows()) != result.annotation.size()) {
        throw DataShapeError("embedding rows do not match the sample annotation");
    }

    out << "sampleID,type,tissue,subtype,Primary/Metastasis,cluster,UMAP_1,UMAP_2";
    for (Eigen::Index c = 0; c < embedding.pcs.cols(); ++c) {
        out << ",PC_" << (c + 1);
    }
    out << "\n";

    for (size_t i = 0; i < result.annotation.size(); ++i) {
        const auto& row = result.annotation[i];
        const auto r = static_cast<Eigen::Index>(i);
        out << row.sampleId << "," << (row.domain == Domain::TUMOR ? "tumor" : "CL") << ","
            << row.tissue << "," << row.subtype << "," << row.collectionContext << ","
            << embedding.clusters.labels[i] << ","
            << embedding.layout(r, 0) << "," << embedding.layout(r, 1);
        for (Eigen::Index c = 0; c < embedding.pcs.cols(); ++c) {
            out << "," << embedding.pcs(r, c);
        }
        out << "\n";
    }
}

void exportGeneSummary(const std::vector<GeneSummary>& summary, const std::string& outputFile) {
    std::ofstream out = openOutput(outputFile);

    out << "Gene,Symbol,Tumor_mean,Tumor_SD,CCLE_mean,CCLE_SD,max_SD,"
           "gene_stat_tumor,gene_stat_CL,tumor_rank,CL_rank,best_rank,alignment_gene\n";
    for (const auto& row : summary) {
        out << row.stats.geneId << "," << row.stats.symbol << ","
            << formatDouble(row.stats.tumorMean) << "," << formatDouble(row.stats.tumorSd) << ","
            << formatDouble(row.stats.cellLineMean) << "," << formatDouble(row.stats.cellLineSd) << ","
            << formatDouble(row.stats.maxSd) << ","
            << formatOptional(row.tumorScore) << "," << formatOptional(row.cellLineScore) << ","
            << formatOptional(row.tumorRank) << "," << formatOptional(row.cellLineRank) << ","
            << formatOptional(row.bestRank) << "," << (row.inAlignmentSet ? "TRUE" : "FALSE") << "\n";
    }
}

void exportAlignmentGenes(const AlignmentGeneSet& genes, const std::string& outputFile) {
    std::ofstream out = openOutput(outputFile);
    for (const auto& gene : genes) {
        out << gene << "\n";
    }
}

}
}
