/**
 * Unit tests for imputation, principal components and the 2-D layout.
 */

#include "EmbeddingBuilder.hpp"
#include "NearestNeighbors.hpp"
#include "AlignmentErrors.hpp"
#include "TestUtils.hpp"
#include <limits>

using namespace cellalign;
using namespace cellalign::test;

namespace {

bool test_impute_missing_with_gene_means() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    ExpressionMatrix m;
    m.sampleIds = {"a", "b", "c"};
    m.genes = {"G1", "G2", "G3"};
    m.values.resize(3, 3);
    m.values << 1, nan, nan,
                nan, 2, nan,
                5, 4, nan;
    int replaced = EmbeddingBuilder::imputeMissing(m);
    CHECK(replaced == 5);
    CHECK(m.values.allFinite());
    CHECK(near(m.values(1, 0), 3.0));
    CHECK(near(m.values(0, 1), 3.0));
    CHECK(m.values.col(2).isZero());
    CHECK(EmbeddingBuilder::imputeMissing(m) == 0);
    return true;
}

bool test_nearest_neighbors() {
    Eigen::MatrixXd ref(4, 1);
    ref << 0, 1, 3, 7;
    Eigen::MatrixXd query(1, 1);
    query << 2.9;
    NeighborList nn = findNearestNeighbors(query, ref, 2);
    CHECK(nn.indices(0, 0) == 2 && nn.indices(0, 1) == 1);
    CHECK(near(nn.distances(0, 0), 0.1, 1e-12));

    NeighborList self = findNearestNeighbors(ref, ref, 10, true);
    CHECK(self.indices.cols() == 3);
    for (int i = 0; i < 4; ++i) {
        for (int c = 0; c < 3; ++c) CHECK(self.indices(i, c) != i);
    }
    CHECK(self.indices(3, 0) == 2);
    return true;
}

bool test_principal_components() {
    SyntheticData data = makeTwoDomainData();
    AlignmentParameters params = smallDataParameters();
    params.pcDims = 70;
    DomainEmbedding e = EmbeddingBuilder(params).buildEmbedding(data.tumor);

    // 50 samples leave 49 components
    CHECK(e.pcs.rows() == 50 && e.pcs.cols() == 49);
    CHECK(e.loadings.rows() == 200 && e.loadings.cols() == 49);
    CHECK(e.warnings.size() == 1);

    CHECK(e.centered.values.colwise().mean().cwiseAbs().maxCoeff() < 1e-10);
    CHECK(near(e.geneMeans(0) + e.centered.values(0, 0), data.tumor.values(0, 0), 1e-10));

    // Orthonormal loadings, scores are projections, full rank reconstructs
    CHECK((e.loadings.transpose() * e.loadings).isIdentity(1e-8));
    CHECK(matricesNear(e.pcs, e.centered.values * e.loadings, 1e-8));
    CHECK((e.pcs * e.loadings.transpose() - e.centered.values).cwiseAbs().maxCoeff() < 1e-8);

    for (Eigen::Index c = 1; c < e.sdev.size(); ++c) CHECK(e.sdev(c) <= e.sdev(c - 1) + 1e-12);
    for (Eigen::Index c = 0; c < e.loadings.cols(); ++c) {
        Eigen::Index idx;
        e.loadings.col(c).cwiseAbs().maxCoeff(&idx);
        CHECK(e.loadings(idx, c) > 0);
    }
    return true;
}

bool test_embedding_rejects_degenerate_input() {
    AlignmentParameters params = smallDataParameters();
    EmbeddingBuilder builder(params);

    ExpressionMatrix tiny;
    tiny.sampleIds = {"a", "b"};
    tiny.genes = {"G1", "G2"};
    tiny.values = Eigen::MatrixXd::Ones(2, 2);
    CHECK_THROWS(builder.buildEmbedding(tiny), NumericalError);

    ExpressionMatrix flat;
    flat.sampleIds = {"a", "b", "c", "d"};
    flat.genes = {"G1", "G2"};
    flat.values = Eigen::MatrixXd::Constant(4, 2, 3.0);
    CHECK_THROWS(builder.buildEmbedding(flat), NumericalError);

    flat.values(0, 0) = std::numeric_limits<double>::quiet_NaN();
    CHECK_THROWS(builder.buildEmbedding(flat), NumericalError);

    flat.genes.pop_back();
    CHECK_THROWS(builder.buildEmbedding(flat), DataShapeError);
    return true;
}

bool test_curve_fit() {
    auto [a, b] = UmapLayout::fitCurve(0.1);
    CHECK(std::abs(a - 1.577) < 0.08);
    CHECK(std::abs(b - 0.895) < 0.05);
    auto [a5, b5] = UmapLayout::fitCurve(0.5);
    CHECK(a5 < a && b5 > b);
    return true;
}

bool test_layout_keeps_groups_apart() {
    SyntheticData data = makeTwoDomainData();
    AlignmentParameters params = smallDataParameters();
    DomainEmbedding e = EmbeddingBuilder(params).buildEmbedding(data.cellLine);
    CHECK(e.layout.rows() == 50 && e.layout.cols() == 2);
    CHECK(e.layout.allFinite());

    double within = 0.0, between = 0.0;
    int nWithin = 0, nBetween = 0;
    for (int i = 0; i < 50; ++i) {
        for (int j = i + 1; j < 50; ++j) {
            double d = (e.layout.row(i) - e.layout.row(j)).norm();
            if (data.cellLineGroups[i] == data.cellLineGroups[j]) {
                within += d;
                ++nWithin;
            } else {
                between += d;
                ++nBetween;
            }
        }
    }
    CHECK(within / nWithin < between / nBetween);

    // Seeded, so repeatable
    DomainEmbedding again = EmbeddingBuilder(params).buildEmbedding(data.cellLine);
    CHECK(matricesNear(e.layout, again.layout, 1e-12));
    return true;
}

}

int main() {
    return runTests("Embedding Tests", {
        {"impute missing", test_impute_missing_with_gene_means},
        {"nearest neighbours", test_nearest_neighbors},
        {"principal components", test_principal_components},
        {"degenerate input", test_embedding_rejects_degenerate_input},
        {"curve fit", test_curve_fit},
        {"layout keeps groups apart", test_layout_keeps_groups_apart},
    });
}
