#include <catch2/catch_test_macros.hpp>
#include "query/criteria.hpp"
#include "query/join_node.hpp"
#include "dialect/ansi_dialect.hpp"
#include "mocks/library_schema.hpp"

using namespace sqlrel;
using sqlrel::testing::LibrarySchema;

namespace {

std::vector<std::string> leaf_aliases(const RelationNode& root) {
    std::vector<std::string> aliases;
    for (const auto& leaf : root.leaves()) {
        aliases.push_back(leaf->alias());
    }
    return aliases;
}

} // anonymous namespace

TEST_CASE("Criteria: sentinel aliases become unique", "[criteria][alias]") {
    LibrarySchema lib;
    auto dialect = std::make_shared<AnsiDialect>();
    auto tree = lib.node(lib.book)->join(lib.node(lib.category));

    auto criteria = tree->criteria(dialect);
    CHECK(leaf_aliases(criteria.root()) == std::vector<std::string>{"this_1", "this_2"});
    CHECK(criteria.from_clause() ==
          "book as this_1 left join category as this_2 on (this_1.category_id = this_2.id)");
}

TEST_CASE("Criteria: caller's tree keeps its aliases", "[criteria][alias]") {
    LibrarySchema lib;
    auto dialect = std::make_shared<AnsiDialect>();
    auto book = lib.node(lib.book);
    auto tree = book->join(lib.node(lib.category));

    auto criteria = tree->criteria(dialect);
    CHECK(book->alias() == "this");
    CHECK(leaf_aliases(*tree) == std::vector<std::string>{"this", "this"});
    CHECK(&criteria.root() != tree.get());
}

TEST_CASE("Criteria: self join through inference gets distinct aliases", "[criteria][alias][self]") {
    LibrarySchema lib;
    auto dialect = std::make_shared<AnsiDialect>();
    auto tree = lib.node(lib.category)->join(lib.node(lib.category));
    REQUIRE(std::dynamic_pointer_cast<ChildToParentJoin>(tree) != nullptr);

    auto criteria = tree->criteria(dialect);
    CHECK(criteria.from_clause() ==
          "category as this_1 left join category as this_2 on (this_1.parent_id = this_2.id)");
}

TEST_CASE("Criteria: generated aliases skip taken names", "[criteria][alias]") {
    LibrarySchema lib;
    auto dialect = std::make_shared<AnsiDialect>();
    auto tree = lib.node(lib.book, "this_1")->join(lib.node(lib.category));

    auto criteria = tree->criteria(dialect);
    CHECK(leaf_aliases(criteria.root()) == std::vector<std::string>{"this_1", "this_2"});
}

TEST_CASE("Criteria: counter is per query", "[criteria][alias]") {
    LibrarySchema lib;
    auto dialect = std::make_shared<AnsiDialect>();
    auto tree = lib.node(lib.book)->join(lib.node(lib.category));

    auto first = tree->criteria(dialect);
    auto second = tree->criteria(dialect);
    CHECK(leaf_aliases(first.root()) == leaf_aliases(second.root()));
    CHECK(leaf_aliases(second.root()).front() == "this_1");
}

TEST_CASE("Criteria: duplicate explicit alias is rejected", "[criteria][alias]") {
    LibrarySchema lib;
    auto dialect = std::make_shared<AnsiDialect>();
    auto tree = lib.node(lib.book, "x")->join(lib.node(lib.category, "x"));

    try {
        [[maybe_unused]] auto criteria = tree->criteria(dialect);
        FAIL("Expected duplicate alias error");
    } catch (const OrmError& e) {
        CHECK(e.category() == ErrorCategory::DUPLICATE_ALIAS);
    }
}

TEST_CASE("Criteria: null dialect is rejected", "[criteria]") {
    LibrarySchema lib;
    CHECK_THROWS_AS(Criteria(lib.node(lib.book), nullptr), OrmError);
}

TEST_CASE("Criteria: columns of every leaf", "[criteria]") {
    LibrarySchema lib;
    auto dialect = std::make_shared<AnsiDialect>();
    auto criteria = lib.node(lib.book, "b")->join(lib.node(lib.category, "c"))->criteria(dialect);

    const auto columns = criteria.columns();
    REQUIRE(columns.size() == 6);
    CHECK(columns[0].full_name() == "b.id");
    CHECK(columns[5].full_name() == "c.parent_id");

    CHECK(criteria.column("c", "name").full_name() == "c.name");
    CHECK(criteria.column("b", "title").column.type == GenericColumnType::TEXT);
    CHECK_THROWS_AS(criteria.column("z", "name"), OrmError);
    CHECK_THROWS_AS(criteria.column("b", "isbn"), OrmError);
}

TEST_CASE("Criteria: projections follow the join order", "[criteria]") {
    LibrarySchema lib;
    auto dialect = std::make_shared<AnsiDialect>();
    auto criteria = lib.node(lib.category)->join(lib.node(lib.book))->criteria(dialect);

    const auto projections = criteria.projections();
    REQUIRE(projections.size() == 2);
    CHECK(projections[0].node().relation_name() == "category");
    CHECK(projections[1].node().relation_name() == "book");
    CHECK(projections[1].node().alias() == "this_2");
}

TEST_CASE("Criteria: full select statement", "[criteria][sql]") {
    LibrarySchema lib;
    auto dialect = std::make_shared<AnsiDialect>();
    auto book = lib.node(lib.book, "b");
    book->select({"id", "title"});
    auto criteria = book->join(lib.node(lib.category, "c"))->criteria(dialect);

    criteria.add("c.name = 'Fiction'").add_order("b.title").limit(10).offset(20);
    CHECK(criteria.orders() == std::vector<std::string>{"b.title"});
    CHECK(criteria.dialect().type() == DatabaseType::ANSI);

    CHECK(criteria.to_sql() ==
          "select b.id as b_id, b.title as b_title, "
          "c.id as c_id, c.name as c_name, c.parent_id as c_parent_id "
          "from book as b left join category as c on (b.category_id = c.id) "
          "where c.name = 'Fiction' order by b.title limit 10 offset 20");
}

TEST_CASE("Criteria: several restrictions are grouped", "[criteria][sql]") {
    LibrarySchema lib;
    auto dialect = std::make_shared<AnsiDialect>();
    auto criteria = lib.node(lib.author, "a")->criteria(dialect);
    criteria.add("a.id > 10").add("a.name like 'A%' or a.name is null");

    CHECK(criteria.restrictions().size() == 2);
    CHECK(criteria.to_sql() ==
          "select a.id as a_id, a.name as a_name from author as a "
          "where (a.id > 10) and (a.name like 'A%' or a.name is null)");
}

TEST_CASE("Criteria: view leaf", "[criteria][sql]") {
    LibrarySchema lib;
    auto dialect = std::make_shared<AnsiDialect>();
    auto criteria = lib.node(lib.book_summary)->criteria(dialect);
    criteria.add_order("this_1.title desc");

    CHECK(criteria.to_sql() ==
          "select this_1.book_id as this_1_book_id, this_1.title as this_1_title "
          "from book_summary as this_1 order by this_1.title desc");
}

TEST_CASE("Criteria: colliding output names are rejected", "[criteria][alias]") {
    LibrarySchema lib;
    auto dialect = std::make_shared<AnsiDialect>();
    auto tree = lib.node(lib.loan, "x")->join(lib.node(lib.book, "x_book"), "x.book_id = x_book.id");

    try {
        [[maybe_unused]] auto criteria = tree->criteria(dialect);
        FAIL("Expected output name collision");
    } catch (const OrmError& e) {
        CHECK(e.category() == ErrorCategory::DUPLICATE_ALIAS);
        CHECK(std::string(e.what()).find("x_book_id") != std::string::npos);
    }

    // Dropping the clashing column from the select list resolves it
    auto loan = lib.node(lib.loan, "x");
    loan->select({"id", "replacement_book_id"});
    auto narrowed = loan->join(lib.node(lib.book, "x_book"), "x.book_id = x_book.id");
    CHECK_NOTHROW(narrowed->criteria(dialect));
}

TEST_CASE("Criteria: mixed-case alias is quoted everywhere", "[criteria][sql]") {
    LibrarySchema lib;
    auto dialect = std::make_shared<PostgresDialect>();
    auto criteria = lib.node(lib.author, "A")->criteria(dialect);

    const auto id = criteria.column("A", "id");
    CHECK(id.full_name() == "A.id");
    CHECK(id.full_name(criteria.dialect()) == "\"A\".id");

    criteria.add(id.full_name(criteria.dialect()) + " > 10");
    CHECK(criteria.to_sql() ==
          "select \"A\".id as \"A_id\", \"A\".name as \"A_name\" from author as \"A\" "
          "where \"A\".id > 10");
}
