#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "query/join_node.hpp"
#include "schema/schema.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace sqlrel;

namespace {

const std::string kLibraryToml = R"(
[orm]
dialect = "postgresql"

[logging]
level = "warn"

[[relations]]
name = "category"
schema = "lib"
primary_key = "id"

[[relations.columns]]
name = "id"
type = "bigint"
nullable = false

[[relations.columns]]
name = "name"
type = "varchar"
unique = true

[[relations.columns]]
name = "parent_id"
type = "bigint"

[[relations.associations]]
column = "parent_id"
references = "category"
on_delete = "set_null"

[[relations]]
name = "book"
schema = "lib"
primary_key = "id"

[[relations.columns]]
name = "id"
type = "bigint"

[[relations.columns]]
name = "title"
type = "text"
default = "'untitled'"

[[relations.columns]]
name = "category_id"
type = "int"

[[relations.associations]]
column = "category_id"
references = "lib.category"
on_delete = "cascade"
on_update = "restrict"

[[relations]]
name = "book_titles"
kind = "view"
definition = "select title from lib.book"

[[relations.columns]]
name = "title"
type = "text"
)";

} // anonymous namespace

TEST_CASE("ConfigLoader: loads relations and builds the schema", "[config]") {
    auto result = ConfigLoader::load_from_string(kLibraryToml);
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.dialect == "postgresql");
    CHECK(cfg.logging.level == "warn");
    REQUIRE(cfg.relations.size() == 3);
    CHECK(cfg.relations[0].qualified_name() == "lib.category");
    CHECK(cfg.relations[1].columns[1].default_value == "'untitled'");
    CHECK(cfg.relations[2].kind == "view");

    REQUIRE(cfg.schema != nullptr);
    REQUIRE(cfg.schema->size() == 3);

    auto book = cfg.schema->get("lib.book");
    REQUIRE(book->primary_key() != nullptr);
    CHECK_FALSE(book->primary_key()->nullable);
    REQUIRE(book->associations().size() == 1);
    CHECK(book->associations()[0].parent_relation == "lib.category");
    CHECK(book->associations()[0].on_delete == ForeignKeyAction::CASCADE);
    CHECK(book->associations()[0].on_update == ForeignKeyAction::RESTRICT);

    // Plain reference resolved within the declaring relation's schema
    auto category = cfg.schema->get("lib.category");
    REQUIRE(category->associations().size() == 1);
    CHECK(category->associations()[0].is_self_reference());
    CHECK(category->find_column("name")->unique);

    auto view = cfg.schema->get("book_titles");
    CHECK(view->kind() == RelationKind::VIEW);
    CHECK(cfg.schema->validate().empty());
}

TEST_CASE("ConfigLoader: built schema drives join inference", "[config]") {
    auto result = ConfigLoader::load_from_string(kLibraryToml);
    REQUIRE(result.success);

    auto book = make_node(result.config.schema->get("lib.book"), "book");
    auto category = make_node(result.config.schema->get("lib.category"), "category");
    auto join = book->join(category);
    CHECK(join->conditions_expression() == "book.category_id = category.id");
}

TEST_CASE("ConfigLoader: defaults for an empty document", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.dialect == "ansi");
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.relations.empty());
    REQUIRE(result.config.schema != nullptr);
    CHECK(result.config.schema->size() == 0);
}

TEST_CASE("ConfigLoader: unknown dialect fails validation", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[orm]
dialect = "oracle"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("orm.dialect") != std::string::npos);
}

TEST_CASE("ConfigLoader: invalid log level fails validation", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "chatty"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigLoader: relation errors are all reported", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[[relations]]
name = "a"
kind = "materialized"

[[relations.columns]]
name = "id"
type = "geometry"

[[relations.associations]]
column = "id"
references = "b"
on_delete = "explode"

[[relations]]
name = "a"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Config validation failed") != std::string::npos);
    CHECK(result.error_message.find("kind") != std::string::npos);
    CHECK(result.error_message.find("geometry") != std::string::npos);
    CHECK(result.error_message.find("on_delete") != std::string::npos);
    CHECK(result.error_message.find("duplicate relation a") != std::string::npos);
}

TEST_CASE("ConfigLoader: unresolved reference fails schema build", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[[relations]]
name = "book"
primary_key = "id"

[[relations.columns]]
name = "id"
type = "bigint"

[[relations.columns]]
name = "category_id"
type = "bigint"

[[relations.associations]]
column = "category_id"
references = "category"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to build schema") != std::string::npos);
    CHECK(result.error_message.find("category") != std::string::npos);
}

TEST_CASE("ConfigLoader: incomparable foreign key fails schema build", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[[relations]]
name = "category"
primary_key = "id"

[[relations.columns]]
name = "id"
type = "bigint"

[[relations]]
name = "book"

[[relations.columns]]
name = "category_id"
type = "uuid"

[[relations.associations]]
column = "category_id"
references = "category"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("not comparable") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML", "[config]") {
    auto result = ConfigLoader::load_from_string("[orm\ndialect = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: environment variables are expanded", "[config][env]") {
    ::setenv("SQLREL_TEST_SCHEMA", "archive", 1);

    auto result = ConfigLoader::load_from_string(R"(
[[relations]]
name = "event"
schema = "${SQLREL_TEST_SCHEMA}"

[[relations.columns]]
name = "id"
type = "uuid"
)");
    REQUIRE(result.success);
    CHECK(result.config.relations[0].schema == "archive");
    CHECK(result.config.schema->contains("archive.event"));

    ::unsetenv("SQLREL_TEST_SCHEMA");
}

TEST_CASE("ConfigLoader: unclosed substitution fails", "[config][env]") {
    auto result = ConfigLoader::load_from_string(R"(
[orm]
dialect = "${UNCLOSED"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

TEST_CASE("ConfigLoader: load from file", "[config]") {
    const auto path = std::filesystem::temp_directory_path() / "sqlrel_test_config.toml";
    {
        std::ofstream out(path);
        out << kLibraryToml;
    }

    auto result = ConfigLoader::load_from_file(path.string());
    REQUIRE(result.success);
    CHECK(result.config.schema->size() == 3);
    std::filesystem::remove(path);

    auto missing = ConfigLoader::load_from_file("/nonexistent/sqlrel.toml");
    CHECK_FALSE(missing.success);
    CHECK(missing.error_message.find("Failed to load config") != std::string::npos);
}

TEST_CASE("ConfigLoader: apply_logging sets the threshold", "[config][logging]") {
    const auto saved = utils::log::get_level();

    ConfigLoader::apply_logging(LoggingConfig{"debug"});
    CHECK(utils::log::get_level() == utils::log::Level::DEBUG);

    // Unknown levels leave the threshold untouched
    ConfigLoader::apply_logging(LoggingConfig{"chatty"});
    CHECK(utils::log::get_level() == utils::log::Level::DEBUG);

    utils::log::set_level(saved);
}
