#include <gtest/gtest.h>

#include <algorithm>

#include "core/DomainOverlapResolver.hpp"
#include "test_utils.hpp"

using namespace BgcNet;
using BgcNet::Testing::make_hit;

TEST(OverlapResolverTest, RemovesLowerScoringOverlap) {
    // 20 of 100 positions shared: 0.2 > 0.1
    std::vector<DomainHit> hits = {
        make_hit("gene1", 0, 100, 50.0, "PF00001.1"),
        make_hit("gene1", 80, 180, 30.0, "PF00002.1"),
    };

    DomainOverlapResolver resolver(0.1);
    ResolvedDomains resolved = resolver.resolve(hits);

    ASSERT_EQ(resolved.hits.size(), 1u);
    EXPECT_DOUBLE_EQ(resolved.hits[0].score, 50.0);
    EXPECT_EQ(resolved.num_removed, 1);
    ASSERT_EQ(resolved.domains.size(), 1u);
    EXPECT_EQ(resolved.domains[0], "PF00001");
}

TEST(OverlapResolverTest, EqualScoresAreBothKept) {
    std::vector<DomainHit> hits = {
        make_hit("gene1", 0, 100, 40.0, "PF00001.1"),
        make_hit("gene1", 10, 110, 40.0, "PF00002.1"),
    };

    ResolvedDomains resolved = DomainOverlapResolver(0.1).resolve(hits);
    EXPECT_EQ(resolved.hits.size(), 2u);
    EXPECT_EQ(resolved.num_removed, 0);
}

TEST(OverlapResolverTest, DifferentCdsNeverCompete) {
    std::vector<DomainHit> hits = {
        make_hit("gene1", 0, 100, 50.0, "PF00001.1"),
        make_hit("gene2", 0, 100, 10.0, "PF00002.1"),
    };

    ResolvedDomains resolved = DomainOverlapResolver(0.1).resolve(hits);
    EXPECT_EQ(resolved.hits.size(), 2u);
}

TEST(OverlapResolverTest, SmallOrTouchingOverlapsAreKept) {
    std::vector<DomainHit> hits = {
        make_hit("gene1", 0, 100, 50.0, "PF00001.1"),
        make_hit("gene1", 95, 200, 10.0, "PF00002.1"),   // 5/100 and 5/105
        make_hit("gene1", 200, 300, 5.0, "PF00003.1"),   // touches the previous hit
    };

    ResolvedDomains resolved = DomainOverlapResolver(0.1).resolve(hits);
    EXPECT_EQ(resolved.hits.size(), 3u);
}

TEST(OverlapResolverTest, NonAdjacentHitsAreCompared) {
    // B and C do not overlap each other but both sit inside A
    std::vector<DomainHit> hits = {
        make_hit("gene1", 250, 260, 5.0, "PF00003.1"),
        make_hit("gene1", 0, 300, 100.0, "PF00001.1"),
        make_hit("gene1", 10, 20, 5.0, "PF00002.1"),
    };

    ResolvedDomains resolved = DomainOverlapResolver(0.1).resolve(hits);
    ASSERT_EQ(resolved.hits.size(), 1u);
    EXPECT_EQ(resolved.hits[0].accession, "PF00001.1");
    EXPECT_EQ(resolved.num_removed, 2);
}

TEST(OverlapResolverTest, OutputSortedByStartAndOrderIndependent) {
    std::vector<DomainHit> hits = {
        make_hit("gene2", 500, 600, 10.0, "PF00004.1"),
        make_hit("gene1", 300, 400, 10.0, "PF00003.1"),
        make_hit("gene1", 0, 100, 50.0, "PF00001.1"),
        make_hit("gene1", 50, 150, 20.0, "PF00002.1"),
    };

    DomainOverlapResolver resolver(0.1);
    ResolvedDomains forward = resolver.resolve(hits);

    std::vector<DomainHit> reversed(hits.rbegin(), hits.rend());
    ResolvedDomains backward = resolver.resolve(reversed);

    std::vector<std::string> expected = {"PF00001", "PF00003", "PF00004"};
    EXPECT_EQ(forward.domains, expected);
    EXPECT_EQ(backward.domains, expected);

    for (size_t i = 1; i < forward.hits.size(); ++i) {
        EXPECT_LE(forward.hits[i - 1].start, forward.hits[i].start);
    }
}

TEST(OverlapResolverTest, NoRetainedPairExceedsCutoff) {
    std::vector<DomainHit> hits;
    for (int i = 0; i < 12; ++i) {
        std::string accession = "PF0000" + std::to_string(i % 10) + ".1";
        double score = static_cast<double>((i * 7) % 11);
        hits.push_back(make_hit("gene1", i * 37, i * 37 + 90, score, accession));
    }

    const double cutoff = 0.1;
    ResolvedDomains resolved = DomainOverlapResolver(cutoff).resolve(hits);

    for (size_t a = 0; a < resolved.hits.size(); ++a) {
        for (size_t b = a + 1; b < resolved.hits.size(); ++b) {
            const DomainHit& x = resolved.hits[a];
            const DomainHit& y = resolved.hits[b];
            if (x.score == y.score) {
                continue;  // equal scores are never resolved
            }
            EXPECT_FALSE(DomainOverlapResolver::overlaps_significantly(x, y, cutoff))
                << x.start << "-" << x.stop << " vs " << y.start << "-" << y.stop;
        }
    }
}

TEST(OverlapResolverTest, ZeroCutoffRemovesAnyOverlap) {
    std::vector<DomainHit> hits = {
        make_hit("gene1", 0, 100, 50.0, "PF00001.1"),
        make_hit("gene1", 99, 200, 10.0, "PF00002.1"),
    };

    EXPECT_EQ(DomainOverlapResolver(0.0).resolve(hits).hits.size(), 1u);
    EXPECT_EQ(DomainOverlapResolver(0.1).resolve(hits).hits.size(), 2u);
}

TEST(OverlapResolverTest, EmptyInput) {
    ResolvedDomains resolved = DomainOverlapResolver().resolve({});
    EXPECT_TRUE(resolved.hits.empty());
    EXPECT_TRUE(resolved.domains.empty());
    EXPECT_EQ(resolved.num_removed, 0);
}

TEST(OverlapResolverTest, OverlapLength) {
    EXPECT_EQ(DomainOverlapResolver::overlap_length(0, 100, 80, 180), 20);
    EXPECT_EQ(DomainOverlapResolver::overlap_length(80, 180, 0, 100), 20);
    EXPECT_EQ(DomainOverlapResolver::overlap_length(0, 100, 100, 200), 0);
    EXPECT_LT(DomainOverlapResolver::overlap_length(0, 100, 150, 200), 0);
    EXPECT_EQ(DomainOverlapResolver::overlap_length(0, 300, 10, 20), 10);
}
