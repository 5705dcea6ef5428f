// ═══════════════════════════════════════════════════════════════════
//  test_registry.cpp — Keyed storage and duplicate detection
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <schemapp/registry.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace schemapp;

TEST(RegistryTest, StartsEmpty) {
    Registry registry;
    EXPECT_EQ(registry.size(Kind::Definitions), 0);
    EXPECT_TRUE(registry.ids(Kind::Resolvers).empty());
    EXPECT_FALSE(registry.hasAny("Query"));
}

TEST(RegistryTest, RegisterAndLookup) {
    Registry registry;
    registry.addDefinition("User", "type User { id: ID! }");
    registry.addResolvers("User", FragmentValue(nlohmann::json{{"User", {{"id", 1}}}}));

    EXPECT_TRUE(registry.has(Kind::Definitions, "User"));
    EXPECT_TRUE(registry.has(Kind::Resolvers, "User"));
    EXPECT_FALSE(registry.has(Kind::Directives, "User"));
    EXPECT_TRUE(registry.hasAny("User"));
    EXPECT_EQ(registry.definition("User"), "type User { id: ID! }");
    EXPECT_EQ(registry.resolvers("User").at("User").at("id").leaf(), 1);
}

TEST(RegistryTest, DuplicateSameKindThrows) {
    Registry registry;
    registry.addDefinition("User", "type User { id: ID! }");

    try {
        registry.addDefinition("User", "type User { name: String }");
        FAIL() << "expected DuplicateIdentifierError";
    } catch (const DuplicateIdentifierError& e) {
        EXPECT_EQ(e.id(), "User");
        ASSERT_TRUE(e.kind().has_value());
        EXPECT_EQ(*e.kind(), Kind::Definitions);
        EXPECT_NE(std::string(e.what()).find("'User'"), std::string::npos);
    }

    // First registration is kept
    EXPECT_EQ(registry.definition("User"), "type User { id: ID! }");
    EXPECT_EQ(registry.size(Kind::Definitions), 1);
}

TEST(RegistryTest, SameIdAcrossKindsIsIndependent) {
    Registry registry;
    EXPECT_NO_THROW(registry.addDefinition("Post", "type Post { id: ID! }"));
    EXPECT_NO_THROW(registry.addResolvers("Post", FragmentValue()));
    EXPECT_NO_THROW(registry.addDirectives("Post", FragmentValue()));
    EXPECT_THROW(registry.addDirectives("Post", FragmentValue()), DuplicateIdentifierError);
}

TEST(RegistryTest, IdsKeepRegistrationOrder) {
    Registry registry;
    registry.addDefinition("zeta", "");
    registry.addDefinition("alpha", "");
    registry.addDefinition("mid", "");

    EXPECT_EQ(registry.ids(Kind::Definitions),
              (std::vector<std::string>{"zeta", "alpha", "mid"}));
}

TEST(RegistryTest, MissingLookupThrows) {
    Registry registry;
    EXPECT_THROW(registry.definition("nope"), SchemaError);
    EXPECT_THROW(registry.resolvers("nope"), SchemaError);
    EXPECT_THROW(registry.directives("nope"), SchemaError);
}

TEST(RegistryTest, ConcurrentDuplicateRegistersOnce) {
    Registry registry;
    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&registry, &accepted, &rejected, i]() {
            try {
                registry.addDefinition("shared", "# writer " + std::to_string(i));
                accepted++;
            } catch (const DuplicateIdentifierError&) {
                rejected++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(rejected.load(), 7);
    EXPECT_EQ(registry.size(Kind::Definitions), 1);
}

TEST(RegistryTest, Movable) {
    Registry registry;
    registry.addDefinition("User", "type User { id: ID! }");

    Registry moved = std::move(registry);
    EXPECT_TRUE(moved.has(Kind::Definitions, "User"));
}

TEST(RegistryTest, MovedFromRegistryIsEmptyAndUsable) {
    Registry registry;
    registry.addDefinition("User", "type User { id: ID! }");
    registry.addResolvers("User", FragmentValue());

    Registry moved(std::move(registry));
    EXPECT_EQ(moved.size(Kind::Definitions), 1);
    EXPECT_TRUE(moved.hasAny("User"));

    EXPECT_FALSE(registry.has(Kind::Definitions, "User"));
    EXPECT_FALSE(registry.hasAny("User"));
    EXPECT_TRUE(registry.ids(Kind::Resolvers).empty());
    EXPECT_NO_THROW(registry.addDefinition("User", "type User"));

    Registry assigned;
    assigned = std::move(moved);
    EXPECT_TRUE(assigned.has(Kind::Resolvers, "User"));
    EXPECT_EQ(moved.size(Kind::Resolvers), 0);
}
