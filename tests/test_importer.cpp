// ═══════════════════════════════════════════════════════════════════
//  test_importer.cpp — Directory import and unit decoding
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <schemapp/console.h>
#include <schemapp/importer.h>
#include <filesystem>
#include <fstream>

using namespace schemapp;

class ImporterTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        saved_ = console::level();
        console::setLevel(console::Level::Silent);

        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() /
              (std::string("schemapp_import_") + info->name());
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
        console::setLevel(saved_);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream out(dir / name, std::ios::binary);
        out << content;
    }

private:
    console::Level saved_ = console::Level::Info;
};

// ═══════════════════════════════════════════
//  Unit::fromJson
// ═══════════════════════════════════════════

TEST(UnitDecodeTest, DecodesAllFields) {
    auto unit = Unit::fromJson({
        {"definitions", "type User { id: ID! }"},
        {"resolvers", {{"User", {{"id", 1}}}}},
        {"directives", {{"upper", true}}},
        {"after", {"Query", "Scalars"}},
        {"before", nlohmann::json::array({"Post"})},
        {"start", false},
        {"end", true},
    });

    ASSERT_TRUE(unit.definitions.has_value());
    EXPECT_EQ(*unit.definitions, "type User { id: ID! }");
    ASSERT_TRUE(unit.resolvers.has_value());
    EXPECT_EQ(unit.resolvers->at("User").at("id").leaf(), 1);
    ASSERT_TRUE(unit.directives.has_value());
    EXPECT_EQ(unit.after, (std::vector<std::string>{"Query", "Scalars"}));
    EXPECT_EQ(unit.before, (std::vector<std::string>{"Post"}));
    EXPECT_FALSE(unit.start);
    EXPECT_TRUE(unit.end);
}

TEST(UnitDecodeTest, EmptyObjectIsEmptyUnit) {
    auto unit = Unit::fromJson(nlohmann::json::object());
    EXPECT_FALSE(unit.definitions.has_value());
    EXPECT_FALSE(unit.resolvers.has_value());
    EXPECT_FALSE(unit.directives.has_value());
    EXPECT_TRUE(unit.after.empty());
    EXPECT_FALSE(unit.start);
}

TEST(UnitDecodeTest, NullFieldsAreAbsent) {
    auto unit = Unit::fromJson({{"definitions", nullptr}, {"resolvers", nullptr},
                                {"after", nullptr}, {"before", nullptr},
                                {"start", nullptr}, {"end", nullptr}});
    EXPECT_FALSE(unit.definitions.has_value());
    EXPECT_FALSE(unit.resolvers.has_value());
    EXPECT_TRUE(unit.after.empty());
    EXPECT_TRUE(unit.before.empty());
    EXPECT_FALSE(unit.start);
    EXPECT_FALSE(unit.end);
}

TEST(UnitDecodeTest, WrongFieldTypesRejected) {
    EXPECT_THROW(Unit::fromJson(nlohmann::json::array()), ImportError);
    EXPECT_THROW(Unit::fromJson({{"definitions", 12}}), ImportError);
    EXPECT_THROW(Unit::fromJson({{"resolvers", "nope"}}), ImportError);
    EXPECT_THROW(Unit::fromJson({{"directives", nlohmann::json::array()}}), ImportError);
    EXPECT_THROW(Unit::fromJson({{"after", "Query"}}), ImportError);
    EXPECT_THROW(Unit::fromJson({{"before", {1, 2}}}), ImportError);
    EXPECT_THROW(Unit::fromJson({{"start", "yes"}}), ImportError);
}

TEST(UnitDecodeTest, ErrorNamesSource) {
    try {
        Unit::fromJson({{"end", 1}}, "schema/footer.json");
        FAIL() << "expected ImportError";
    } catch (const ImportError& e) {
        EXPECT_EQ(e.source(), "schema/footer.json");
        EXPECT_NE(std::string(e.what()).find("'end'"), std::string::npos);
    }
}

// ═══════════════════════════════════════════
//  importUnit
// ═══════════════════════════════════════════

TEST_F(ImporterTest, ImportUnitRegistersAndDeclares) {
    SchemaBuilder builder;
    Importer importer(builder);

    Unit unit;
    unit.definitions = "type Post { id: ID! }";
    unit.resolvers = FragmentValue(nlohmann::json{{"Post", {{"id", "p"}}}});
    unit.after = {"User"};
    unit.end = true;
    importer.importUnit("Post", unit);

    EXPECT_TRUE(builder.has(Kind::Definitions, "Post"));
    EXPECT_TRUE(builder.has(Kind::Resolvers, "Post"));
    EXPECT_FALSE(builder.has(Kind::Directives, "Post"));
    EXPECT_TRUE(builder.constraints().follows("Post", "User"));
    EXPECT_TRUE(builder.constraints().isEnd("Post"));
}

TEST_F(ImporterTest, KnownIdRejectedBeforeAnyRegistration) {
    SchemaBuilder builder;
    builder.addDefinitions("User", "type User");
    Importer importer(builder);

    Unit unit;
    unit.resolvers = FragmentValue(nlohmann::json{{"User", {{"id", 1}}}});
    unit.start = true;

    EXPECT_THROW(importer.importUnit("User", unit), DuplicateIdentifierError);
    EXPECT_FALSE(builder.has(Kind::Resolvers, "User"));
    EXPECT_FALSE(builder.constraints().isStart("User"));
}

// ═══════════════════════════════════════════
//  importFrom
// ═══════════════════════════════════════════

TEST_F(ImporterTest, ImportsWhitelistedTopLevelFiles) {
    write("Query.graphql", "type Query { me: User }");
    write("user.json", R"({
        "definitions": "type User { id: ID! }",
        "resolvers": { "User": { "id": "u" } },
        "after": ["Query"]
    })");
    write("notes.txt", "ignored");
    std::filesystem::create_directories(dir / "nested.json");
    write("scalars.gql", "scalar Date");

    SchemaBuilder builder;
    EXPECT_EQ(builder.importFrom(dir.string()), 3);

    EXPECT_TRUE(builder.has(Kind::Definitions, "Query"));
    EXPECT_TRUE(builder.has(Kind::Definitions, "user"));
    EXPECT_TRUE(builder.has(Kind::Resolvers, "user"));
    EXPECT_TRUE(builder.has(Kind::Definitions, "scalars"));
    EXPECT_FALSE(builder.hasAny("notes"));
    EXPECT_FALSE(builder.hasAny("nested"));
}

TEST_F(ImporterTest, ImportedRulesDriveTheOrder) {
    write("a_footer.json", R"({ "definitions": "# footer", "end": true })");
    write("b_post.json", R"({ "definitions": "type Post", "after": ["c_user"] })");
    write("c_user.graphql", "type User");
    write("d_scalars.json", R"({ "definitions": "scalar Date", "start": true })");
    write("Query.graphql", "type Query");

    SchemaBuilder builder;
    builder.importFrom(dir.string());

    EXPECT_EQ(builder.order(Kind::Definitions),
              (std::vector<std::string>{"Query", "d_scalars", "c_user", "b_post", "a_footer"}));
}

TEST_F(ImporterTest, SameStemTwiceIsDuplicate) {
    write("user.graphql", "type User");
    write("user.json", R"({ "resolvers": { "User": {} } })");

    SchemaBuilder builder;
    EXPECT_THROW(builder.importFrom(dir.string()), DuplicateIdentifierError);
    EXPECT_TRUE(builder.has(Kind::Definitions, "user"));
    EXPECT_FALSE(builder.has(Kind::Resolvers, "user"));
}

TEST_F(ImporterTest, MissingDirectoryImportsNothing) {
    SchemaBuilder builder;
    EXPECT_EQ(builder.importFrom((dir / "does-not-exist").string()), 0);
}

TEST_F(ImporterTest, FileInsteadOfDirectoryFails) {
    write("single.json", "{}");
    SchemaBuilder builder;
    EXPECT_THROW(builder.importFrom((dir / "single.json").string()), ImportError);
}

TEST_F(ImporterTest, MalformedJsonFails) {
    write("broken.json", "{ \"definitions\": ");
    SchemaBuilder builder;
    EXPECT_THROW(builder.importFrom(dir.string()), ImportError);
}

TEST_F(ImporterTest, CustomExtensionWhitelist) {
    write("Query.graphql", "type Query");
    write("user.json", R"({ "definitions": "type User" })");
    write("extra.schema", R"({ "definitions": "type Extra" })");

    SchemaBuilder builder;
    Importer importer(builder, {".schema"});
    EXPECT_EQ(importer.importFrom(dir.string()), 1);
    EXPECT_TRUE(builder.has(Kind::Definitions, "extra"));
    EXPECT_FALSE(builder.hasAny("Query"));
}

TEST_F(ImporterTest, ReadUnitFromSdlFile) {
    write("types.graphql", "type A { id: ID }\n");
    auto unit = Importer::readUnit((dir / "types.graphql").string());

    ASSERT_TRUE(unit.definitions.has_value());
    EXPECT_EQ(*unit.definitions, "type A { id: ID }\n");
    EXPECT_FALSE(unit.resolvers.has_value());
}
