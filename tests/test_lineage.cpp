#include "test_helpers.hpp"
#include <naming/entity_lineage.hpp>
#include <naming/naming_registry.hpp>
#include <naming/physical_groups.hpp>
#include <gtest/gtest.h>

#include <algorithm>

using namespace magnetmesh;
using test::FakeKernel;

namespace {

struct LineageFixture {
    FakeKernel kernel{test::make_world()};
    NamingRegistry registry;
    EntityLineage lineage;

    BooleanResult run(BooleanOp op, const DimTags& objects, const DimTags& tools,
                      bool remove_tool = true) {
        auto rec = lineage.record(op, objects, tools, remove_tool, kernel);
        auto result = kernel.boolean(op, objects, tools, remove_tool);
        kernel.synchronize();
        lineage.rebind_after_operation(rec, result);
        return result;
    }

    double total_mass(const DimTags& tags) const {
        double m = 0.0;
        for (const auto& t : tags) m += kernel.mass(t);
        return m;
    }
};

bool shares(const DimTags& a, const DimTags& b) {
    return std::any_of(a.begin(), a.end(), [&](const DimTag& t) {
        return std::find(b.begin(), b.end(), t) != b.end();
    });
}

}  // namespace

TEST(EntityLineage, FragmentSplitsAndShares) {
    LineageFixture f;
    const auto& a = f.registry.register_name({"A"}, Category::Conductor, 2);
    const auto& b = f.registry.register_name({"B"}, Category::Conductor, 2);
    int ta = f.kernel.add_rectangle(0.0, 0.0, 2.0, 1.0);
    int tb = f.kernel.add_rectangle(1.0, 0.0, 2.0, 1.0);
    f.lineage.bind(a, {{2, ta}});
    f.lineage.bind(b, {{2, tb}});

    auto result = f.run(BooleanOp::Fragment, {{2, ta}}, {{2, tb}});
    EXPECT_EQ(result.out.size(), 3u);

    DimTags ra = f.lineage.resolve(a);
    DimTags rb = f.lineage.resolve(b);
    EXPECT_EQ(ra.size(), 2u);
    EXPECT_EQ(rb.size(), 2u);
    EXPECT_TRUE(shares(ra, rb));
    EXPECT_NEAR(f.total_mass(ra), 2.0, 1e-12);
    EXPECT_NEAR(f.total_mass(rb), 2.0, 1e-12);
    EXPECT_TRUE(f.lineage.unresolved(f.kernel.entities(2)).empty());
}

TEST(EntityLineage, EarlierGenerationsStayAnswerable) {
    LineageFixture f;
    const auto& a = f.registry.register_name({"A"}, Category::Conductor, 2);
    const auto& b = f.registry.register_name({"B"}, Category::Conductor, 2);
    int ta = f.kernel.add_rectangle(0.0, 0.0, 2.0, 1.0);
    int tb = f.kernel.add_rectangle(1.0, 0.0, 2.0, 1.0);
    f.lineage.bind(a, {{2, ta}});
    f.lineage.bind(b, {{2, tb}});
    const Generation before = f.lineage.generation();

    f.run(BooleanOp::Fragment, {{2, ta}}, {{2, tb}});

    EXPECT_EQ(f.lineage.generation(), before + 1);
    EXPECT_EQ(f.lineage.resolve_at(a.id, before), (DimTags{{2, ta}}));
    EXPECT_EQ(f.lineage.resolve_at(a.id, f.lineage.generation()), f.lineage.resolve(a));
}

TEST(EntityLineage, NamesSurviveBooleanChains) {
    LineageFixture f;
    const auto& plate = f.registry.register_name({"Plate"}, Category::Conductor, 2);
    const auto& ring = f.registry.register_name({"Ring"}, Category::Conductor, 2);
    const auto& hole = f.registry.register_name({"Hole"}, Category::Channel, 2);
    int tp = f.kernel.add_rectangle(0.0, 0.0, 4.0, 2.0);
    int tr = f.kernel.add_rectangle(3.0, 0.0, 2.0, 2.0);
    int th = f.kernel.add_rectangle(1.0, 0.5, 1.0, 1.0);
    f.lineage.bind(plate, {{2, tp}});
    f.lineage.bind(ring, {{2, tr}});
    f.lineage.bind(hole, {{2, th}});

    // Keep the hole as its own region, then make everything conformal
    f.run(BooleanOp::Cut, {{2, tp}}, {{2, th}}, false);
    ASSERT_EQ(f.lineage.resolve(hole), (DimTags{{2, th}}));

    DimTags all = f.lineage.resolve(plate);
    all.push_back({2, tr});
    all.push_back({2, th});
    f.run(BooleanOp::Fragment, all, {});

    for (const auto* name : {&plate, &ring, &hole}) {
        EXPECT_FALSE(f.lineage.resolve(*name).empty()) << name->path;
    }
    EXPECT_NEAR(f.total_mass(f.lineage.resolve(hole)), 1.0, 1e-12);
    EXPECT_NEAR(f.total_mass(f.lineage.resolve(plate)), 7.0, 1e-12);
    EXPECT_TRUE(f.lineage.unresolved(f.kernel.entities(2)).empty());
}

TEST(EntityLineage, RemovedCutToolStaysResolvable) {
    LineageFixture f;
    const auto& plate = f.registry.register_name({"Plate"}, Category::Conductor, 2);
    const auto& hole = f.registry.register_name({"Hole"}, Category::Channel, 2);
    int tp = f.kernel.add_rectangle(0.0, 0.0, 4.0, 2.0);
    int th = f.kernel.add_rectangle(1.0, 0.5, 1.0, 1.0);
    f.lineage.bind(plate, {{2, tp}});
    f.lineage.bind(hole, {{2, th}});

    const Generation before = f.lineage.generation();
    f.run(BooleanOp::Cut, {{2, tp}}, {{2, th}}, true);

    // The hole answers with the entity it held when the cut consumed it
    EXPECT_TRUE(f.lineage.consumed(hole.id));
    EXPECT_EQ(f.lineage.consumed_at(hole.id), before);
    EXPECT_EQ(f.lineage.resolve(hole), (DimTags{{2, th}}));
    EXPECT_FALSE(f.lineage.consumed(plate.id));
    DimTags kept = f.lineage.resolve(plate);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_NEAR(f.kernel.mass(kept.front()), 7.0, 1e-12);
    EXPECT_TRUE(f.lineage.unresolved(f.kernel.entities(2)).empty());

    // A consumed name gets no physical group
    PhysicalGroupSet groups = flatten(f.registry, f.lineage, GroupingOptions{});
    EXPECT_EQ(groups.find("Hole"), nullptr);
    EXPECT_NE(groups.find("Plate"), nullptr);

    // Binding new entities brings it back
    int fresh = f.kernel.add_rectangle(5.0, 0.0, 1.0, 1.0);
    f.lineage.bind(hole, {{2, fresh}});
    EXPECT_FALSE(f.lineage.consumed(hole.id));
    EXPECT_EQ(f.lineage.resolve(hole), (DimTags{{2, fresh}}));
}

TEST(EntityLineage, CutObjectThatVanishesIsNotConsumed) {
    LineageFixture f;
    const auto& inner = f.registry.register_name({"Inner"}, Category::Conductor, 2);
    int ti = f.kernel.add_rectangle(1.0, 1.0, 1.0, 1.0);
    int tt = f.kernel.add_rectangle(0.0, 0.0, 4.0, 4.0);
    f.lineage.bind(inner, {{2, ti}});

    f.run(BooleanOp::Cut, {{2, ti}}, {{2, tt}}, true);

    EXPECT_FALSE(f.lineage.consumed(inner.id));
    EXPECT_TRUE(f.lineage.resolve(inner).empty());
}

TEST(EntityLineage, FuseKeepsLargerName) {
    LineageFixture f;
    // Registration order and measure disagree: the larger one must win
    const auto& small = f.registry.register_name({"Small"}, Category::Conductor, 2);
    const auto& big = f.registry.register_name({"Big"}, Category::Conductor, 2);
    int ts = f.kernel.add_rectangle(0.0, 0.0, 1.0, 1.0);
    int tb = f.kernel.add_rectangle(1.0, 0.0, 2.0, 1.0);
    f.lineage.bind(small, {{2, ts}});
    f.lineage.bind(big, {{2, tb}});

    f.run(BooleanOp::Fuse, {{2, ts}}, {{2, tb}});

    EXPECT_EQ(f.lineage.canonical(small.id), big.id);
    EXPECT_EQ(f.lineage.canonical(big.id), big.id);
    ASSERT_EQ(f.lineage.merges().size(), 1u);
    EXPECT_EQ(f.lineage.merges()[0].survivor, big.id);
    EXPECT_EQ(f.lineage.merges()[0].merged, small.id);
    EXPECT_EQ(f.lineage.resolve(small), f.lineage.resolve(big));
    EXPECT_EQ(f.lineage.resolve(big).size(), 1u);
}

TEST(EntityLineage, FuseTieKeepsEarlierRegistration) {
    LineageFixture f;
    const auto& first = f.registry.register_name({"First"}, Category::Conductor, 2);
    const auto& second = f.registry.register_name({"Second"}, Category::Conductor, 2);
    int t1 = f.kernel.add_rectangle(0.0, 0.0, 1.0, 1.0);
    int t2 = f.kernel.add_rectangle(1.0, 0.0, 1.0, 1.0);
    f.lineage.bind(first, {{2, t1}});
    f.lineage.bind(second, {{2, t2}});

    // Second as the object: operand order does not decide the tie
    f.run(BooleanOp::Fuse, {{2, t2}}, {{2, t1}});

    EXPECT_EQ(f.lineage.canonical(second.id), first.id);
}

TEST(EntityLineage, PaddingLosesOverlaps) {
    LineageFixture f;
    const auto& air = f.registry.register_name({"Air"}, Category::Air, 2, true);
    const auto& coil = f.registry.register_name({"Coil"}, Category::Conductor, 2);
    int ta = f.kernel.add_rectangle(0.0, 0.0, 4.0, 4.0);
    int tc = f.kernel.add_rectangle(1.0, 1.0, 1.0, 1.0);
    f.lineage.bind(air, {{2, ta}});
    f.lineage.bind(coil, {{2, tc}});

    f.run(BooleanOp::Fragment, {{2, ta}}, {{2, tc}});

    DimTags rc = f.lineage.resolve(coil);
    DimTags ra = f.lineage.resolve(air);
    ASSERT_EQ(rc.size(), 1u);
    EXPECT_NEAR(f.kernel.mass(rc.front()), 1.0, 1e-12);
    EXPECT_FALSE(shares(ra, rc));
    EXPECT_NEAR(f.total_mass(ra), 15.0, 1e-12);
    EXPECT_EQ(f.lineage.owners(rc.front()), (std::vector<NameId>{coil.id}));
}

TEST(EntityLineage, KeptToolKeepsIdentity) {
    LineageFixture f;
    const auto& body = f.registry.register_name({"Body"}, Category::Conductor, 2);
    const auto& tool = f.registry.register_name({"Tool"}, Category::Structure, 2);
    int tb = f.kernel.add_rectangle(0.0, 0.0, 2.0, 1.0);
    int tt = f.kernel.add_rectangle(1.5, 0.0, 1.0, 1.0);
    f.lineage.bind(body, {{2, tb}});
    f.lineage.bind(tool, {{2, tt}});

    // The kernel reports a kept tool as itself
    f.run(BooleanOp::Cut, {{2, tb}}, {{2, tt}}, false);
    EXPECT_EQ(f.lineage.resolve(tool), (DimTags{{2, tt}}));

    // A kept tool left out of the ancestry is still carried over
    OperationRecord rec = f.lineage.record(BooleanOp::Cut, f.lineage.resolve(body), {{2, tt}},
                                           false, f.kernel);
    BooleanResult silent;
    silent.out = f.lineage.resolve(body);
    silent.ancestry = {f.lineage.resolve(body), {}};
    f.lineage.rebind_after_operation(rec, silent);
    EXPECT_EQ(f.lineage.resolve(tool), (DimTags{{2, tt}}));
}

TEST(EntityLineage, LowerDimensionalInputsPassThrough) {
    LineageFixture f;
    const auto& face = f.registry.register_name({"Face"}, Category::Conductor, 2);
    const auto& axis = f.registry.register_name({"ZAxis"}, Category::Boundary, 1);
    int tf = f.kernel.add_rectangle(0.0, 0.0, 1.0, 1.0);
    int ta = f.kernel.add_segment({0.0, -1.0, 0.0}, {0.0, 2.0, 0.0});
    f.lineage.bind(face, {{2, tf}});
    f.lineage.bind(axis, {{1, ta}});

    f.run(BooleanOp::Fragment, {{2, tf}}, {{1, ta}});

    EXPECT_EQ(f.lineage.resolve(axis), (DimTags{{1, ta}}));
    EXPECT_EQ(f.lineage.resolve(face).size(), 1u);
}

TEST(EntityLineage, ReplaceRetiresPreviousTags) {
    EntityLineage lineage;
    NamingRegistry registry;
    const auto& hp = registry.register_name({"HP"}, Category::Boundary, 1);
    lineage.bind(hp, {{1, 4}, {1, 5}});
    const Generation bound = lineage.generation();

    lineage.replace(hp, {{1, 9}});

    EXPECT_EQ(lineage.resolve(hp), (DimTags{{1, 9}}));
    EXPECT_EQ(lineage.resolve_at(hp.id, bound), (DimTags{{1, 4}, {1, 5}}));
    EXPECT_TRUE(lineage.owners({1, 4}).empty());
}

TEST(EntityLineage, ReplaceKeepsTagsSharedWithOtherNames) {
    EntityLineage lineage;
    NamingRegistry registry;
    const auto& a = registry.register_name({"A"}, Category::Boundary, 1);
    const auto& b = registry.register_name({"B"}, Category::Boundary, 1);
    lineage.bind(a, {{1, 1}});
    lineage.bind(b, {{1, 1}});

    lineage.replace(a, {{1, 2}});

    EXPECT_EQ(lineage.resolve(b), (DimTags{{1, 1}}));
    EXPECT_EQ(lineage.owners({1, 1}), (std::vector<NameId>{b.id}));
}

TEST(EntityLineage, UnresolvedSkipsDiscarded) {
    EntityLineage lineage;
    NamingRegistry registry;
    lineage.bind(registry.register_name({"A"}, Category::Conductor, 2), {{2, 1}});

    DimTags all{{2, 1}, {2, 2}, {2, 3}};
    EXPECT_EQ(lineage.unresolved(all), (DimTags{{2, 2}, {2, 3}}));

    lineage.discard({{2, 3}});
    EXPECT_EQ(lineage.unresolved(all), (DimTags{{2, 2}}));
    EXPECT_EQ(lineage.discarded().size(), 1u);

    // A discarded tag handed out again belongs to its new owner
    lineage.bind(registry.register_name({"B"}, Category::Conductor, 2), {{2, 3}});
    EXPECT_TRUE(lineage.discarded().empty());
    EXPECT_EQ(lineage.unresolved(all), (DimTags{{2, 2}}));
}

TEST(EntityLineage, RebindMappedFollowsRevolution) {
    LineageFixture f;
    const auto& coil = f.registry.register_name({"Coil"}, Category::Conductor, 2);
    int tc = f.kernel.add_rectangle(1.0, 0.0, 1.0, 1.0);
    f.lineage.bind(coil, {{2, tc}});

    std::vector<DimTags> ancestry;
    DimTags volumes = f.kernel.revolve({{2, tc}}, Axis::Y, 90.0, ancestry);
    f.lineage.rebind_mapped({{2, tc}}, ancestry);

    EXPECT_EQ(f.lineage.resolve(coil), volumes);
    EXPECT_EQ(volumes.front().dim, 3);
}
