#pragma once

#include "DataStructures.hpp"
#include <string>
#include <vector>

namespace cellalign {
namespace io {

// Splits one CSV line; double-quoted fields may contain commas and "" escapes
std::vector<std::string> splitCsvLine(const std::string& line);

// Header row holds gene ids after a leading sample-id column; empty, NA and
// NaN cells load as missing (NaN)
ExpressionMatrix loadExpressionMatrix(const std::string& path);

// Columns sampleID, type, tissue, subtype and Primary/Metastasis in any order;
// type is tumor, CL or cell_line
std::vector<SampleAnnotation> loadAnnotation(const std::string& path);

// Columns ensembl_gene_id, symbol and locus_group in any order
std::vector<GeneReference> loadGeneReference(const std::string& path);

// key = value lines, '#' starts a comment; unknown keys are rejected
AlignmentParameters loadParameters(const std::string& path, AlignmentParameters params = AlignmentParameters());

void exportMatrix(const ExpressionMatrix& matrix, const std::string& outputFile);
void exportEmbedding(const AlignmentResult& result, const std::string& outputFile);
void exportGeneSummary(const std::vector<GeneSummary>& summary, const std::string& outputFile);
void exportAlignmentGenes(const AlignmentGeneSet& genes, const std::string& outputFile);

}
}
