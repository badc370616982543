#include "test_helpers.hpp"
#include <common/errors.hpp>
#include <naming/naming_registry.hpp>
#include <naming/physical_groups.hpp>
#include <gtest/gtest.h>

using namespace magnetmesh;

TEST(NamingRegistry, JoinsSegments) {
    EXPECT_EQ(join_path({"M1", "H1", "Cu0"}), "M1_H1_Cu0");
    EXPECT_EQ(join_path({"", "Air"}), "Air");
    EXPECT_EQ(join_path({}), "");
}

TEST(NamingRegistry, IndexedNamesAreDeterministic) {
    auto build = []() {
        NamingRegistry registry;
        registry.register_indexed({"Bitter1", "B"}, Category::Conductor, 2);
        registry.register_indexed({"Bitter1", "slit"}, Category::Channel, 1);
        registry.register_indexed({"Bitter1", "B"}, Category::Conductor, 2);
        registry.register_indexed({"Bitter1", "slit"}, Category::Channel, 1);
        std::vector<std::string> paths;
        for (const auto& n : registry.names()) paths.push_back(n.path);
        return paths;
    };

    auto first = build();
    auto second = build();
    EXPECT_EQ(first, second);
    ASSERT_EQ(first.size(), 4u);
    EXPECT_EQ(first[0], "Bitter1_B0");
    EXPECT_EQ(first[1], "Bitter1_slit0");
    EXPECT_EQ(first[2], "Bitter1_B1");
    EXPECT_EQ(first[3], "Bitter1_slit1");
}

TEST(NamingRegistry, IdsFollowRegistrationOrder) {
    NamingRegistry registry;
    const auto& a = registry.register_name({"A"}, Category::Conductor, 2);
    const auto& b = registry.register_name({"B"}, Category::Isolant, 2);
    EXPECT_EQ(a.id, 0u);
    EXPECT_EQ(b.id, 1u);
    // References stay valid as the registry grows
    for (int i = 0; i < 100; ++i) {
        registry.register_indexed({"C"}, Category::Channel, 1);
    }
    EXPECT_EQ(a.path, "A");
    EXPECT_EQ(b.category, Category::Isolant);
    EXPECT_EQ(registry.at("C99").dim, 1);
    EXPECT_EQ(registry.find("C100"), nullptr);
}

TEST(NamingRegistry, CollisionRaises) {
    NamingRegistry registry;
    registry.register_name({"Insert", "H1"}, Category::Conductor, 2);
    try {
        registry.register_name({"Insert", "H1"}, Category::Conductor, 2);
        FAIL() << "expected a collision";
    } catch (const NamingCollisionError& e) {
        EXPECT_EQ(e.name(), "Insert_H1");
    }
    // An exact name clashing with an indexed one is also caught
    registry.register_indexed({"R"}, Category::Conductor, 2);
    EXPECT_THROW(registry.register_name({"R0"}, Category::Conductor, 2), NamingCollisionError);
}

TEST(NamingRegistry, EmptyPathIsRejected) {
    NamingRegistry registry;
    EXPECT_THROW(registry.register_name({}, Category::Conductor, 2), ValidationError);
    EXPECT_THROW(registry.register_name({"", ""}, Category::Conductor, 2), ValidationError);
    EXPECT_THROW(registry.register_indexed({}, Category::Conductor, 2), ValidationError);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(NamingRegistry, UnknownLookups) {
    NamingRegistry registry;
    EXPECT_THROW(registry.get(3), std::out_of_range);
    EXPECT_THROW(registry.at("missing"), std::out_of_range);
}

TEST(PhysicalGroups, StripIndex) {
    EXPECT_EQ(strip_index("S1_I3"), "S1_I");
    EXPECT_EQ(strip_index("Channel12"), "Channel");
    EXPECT_EQ(strip_index("HP"), "HP");
}

TEST(PhysicalGroups, AddMergesTagsPerNameAndDim) {
    PhysicalGroupSet groups;
    groups.add("H1", Category::Conductor, 2, {5, 2});
    groups.add("H1", Category::Conductor, 2, {3, 2});
    groups.add("H1", Category::Boundary, 1, {7});

    ASSERT_EQ(groups.size(), 2u);
    const PhysicalGroup* faces = groups.find("H1", 2);
    ASSERT_NE(faces, nullptr);
    EXPECT_EQ(faces->tags, (std::vector<int>{2, 3, 5}));
    EXPECT_NE(groups.find("H1", 1), nullptr);
    EXPECT_EQ(groups.count(Category::Conductor), 1u);
}

namespace {

// Two pancakes separated by isolants, plus two channels
struct GroupFixture {
    NamingRegistry registry;
    EntityLineage lineage;

    GroupFixture() {
        lineage.bind(registry.register_indexed({"S1", "P"}, Category::Conductor, 2), {{2, 1}});
        lineage.bind(registry.register_indexed({"S1", "P"}, Category::Conductor, 2), {{2, 2}});
        lineage.bind(registry.register_indexed({"S1", "I"}, Category::Isolant, 2), {{2, 3}});
        lineage.bind(registry.register_indexed({"S1", "I"}, Category::Isolant, 2), {{2, 4}});
        lineage.bind(registry.register_indexed({"Channel"}, Category::Channel, 1), {{1, 10}});
        lineage.bind(registry.register_indexed({"Channel"}, Category::Channel, 1), {{1, 11}});
        // Registered but never bound
        registry.register_name({"Ghost"}, Category::Conductor, 2);
    }
};

}  // namespace

TEST(PhysicalGroups, FlattenOneGroupPerName) {
    GroupFixture f;
    auto groups = flatten(f.registry, f.lineage);
    EXPECT_EQ(groups.size(), 6u);
    EXPECT_NE(groups.find("S1_P0"), nullptr);
    EXPECT_NE(groups.find("S1_I1"), nullptr);
    EXPECT_NE(groups.find("Channel1"), nullptr);
    EXPECT_EQ(groups.find("Ghost"), nullptr);
}

TEST(PhysicalGroups, GroupingOptions) {
    GroupFixture f;

    GroupingOptions hide;
    hide.hide_isolants = true;
    auto hidden = flatten(f.registry, f.lineage, hide);
    EXPECT_EQ(hidden.count(Category::Isolant), 0u);
    EXPECT_EQ(hidden.count(Category::Conductor), 2u);

    GroupingOptions merged;
    merged.group_isolants = true;
    merged.group_channels = true;
    auto grouped = flatten(f.registry, f.lineage, merged);
    const PhysicalGroup* isolants = grouped.find("S1_I");
    ASSERT_NE(isolants, nullptr);
    EXPECT_EQ(isolants->tags, (std::vector<int>{3, 4}));
    const PhysicalGroup* channels = grouped.find("Channel");
    ASSERT_NE(channels, nullptr);
    EXPECT_EQ(channels->tags, (std::vector<int>{10, 11}));
    EXPECT_EQ(grouped.count(Category::Conductor), 2u);
}

TEST(PhysicalGroups, ApplyTagsTheKernel) {
    GroupFixture f;
    test::FakeKernel kernel(test::make_world());
    apply(kernel, flatten(f.registry, f.lineage));

    auto groups = kernel.physical_groups();
    ASSERT_EQ(groups.size(), 6u);
    bool found = false;
    for (const auto& g : groups) {
        if (g.name == "S1_P1") {
            found = true;
            EXPECT_EQ(g.dim, 2);
            EXPECT_EQ(g.entities, (std::vector<int>{2}));
        }
    }
    EXPECT_TRUE(found);
}
