#include <catch2/catch_test_macros.hpp>
#include "query/join_node.hpp"
#include "dialect/ansi_dialect.hpp"
#include "mocks/library_schema.hpp"

using namespace sqlrel;
using sqlrel::testing::LibrarySchema;

TEST_CASE("JoinInference: child to parent", "[join][inference]") {
    LibrarySchema lib;
    auto join = lib.node(lib.book, "book")->join(lib.node(lib.category, "category"));

    auto typed = std::dynamic_pointer_cast<ChildToParentJoin>(join);
    REQUIRE(typed != nullptr);
    CHECK(typed->association().child_column.name == "category_id");
    CHECK(join->conditions_expression() == "book.category_id = category.id");
    CHECK(join->on() == "on (book.category_id = category.id)");
    CHECK(join->join_type() == JoinType::LEFT);
}

TEST_CASE("JoinInference: explicit join type keeps the condition", "[join][inference]") {
    LibrarySchema lib;
    auto join = lib.node(lib.book, "book")->join(lib.node(lib.category, "category"), JoinType::INNER);

    CHECK(std::dynamic_pointer_cast<ChildToParentJoin>(join) != nullptr);
    CHECK(join->conditions_expression() == "book.category_id = category.id");
    CHECK(join->join_type() == JoinType::INNER);
}

TEST_CASE("JoinInference: default join renders LEFT", "[join][inference]") {
    LibrarySchema lib;
    AnsiDialect dialect;
    auto join = lib.node(lib.book, "b")->join(lib.node(lib.category, "c"));
    CHECK(join->to_sql(dialect) == "book as b left join category as c on (b.category_id = c.id)");
}

TEST_CASE("JoinInference: parent to child", "[join][inference]") {
    LibrarySchema lib;
    auto join = lib.node(lib.category, "c")->join(lib.node(lib.book, "b"));

    auto typed = std::dynamic_pointer_cast<ParentToChildJoin>(join);
    REQUIRE(typed != nullptr);
    CHECK(join->conditions_expression() == "b.category_id = c.id");
    CHECK(join->alias() == "c");
    CHECK(join->relation_name() == "category");
}

TEST_CASE("JoinInference: condition holds for any starting aliases", "[join][inference]") {
    LibrarySchema lib;
    for (const auto& [child_alias, parent_alias] :
         std::vector<std::pair<std::string, std::string>>{{"b", "c"}, {"x1", "y1"}, {"this", "cat"}}) {
        auto join = lib.node(lib.book, child_alias)->join(lib.node(lib.category, parent_alias));
        CHECK(join->conditions_expression() ==
              child_alias + ".category_id = " + parent_alias + ".id");
    }
}

TEST_CASE("JoinInference: aliasing after join updates the condition", "[join][inference]") {
    LibrarySchema lib;
    auto book = lib.node(lib.book);
    auto category = lib.node(lib.category);
    auto join = book->join(category);

    book->as("b");
    category->as("c");
    CHECK(join->conditions_expression() == "b.category_id = c.id");
}

TEST_CASE("JoinInference: unrelated relations fail", "[join][inference]") {
    LibrarySchema lib;
    auto book = lib.node(lib.book);
    auto author = lib.node(lib.author);

    try {
        [[maybe_unused]] auto join = book->join(author);
        FAIL("Expected join to fail");
    } catch (const OrmError& e) {
        CHECK(e.category() == ErrorCategory::ASSOCIATION_NOT_FOUND);
        CHECK(std::string(e.what()) == "Failed to join book with author: no associations found");
    }
}

TEST_CASE("JoinInference: two candidate associations fail", "[join][inference]") {
    LibrarySchema lib;
    auto loan = lib.node(lib.loan);

    try {
        [[maybe_unused]] auto join = loan->join(lib.node(lib.book));
        FAIL("Expected join to fail");
    } catch (const OrmError& e) {
        CHECK(e.category() == ErrorCategory::AMBIGUOUS_ASSOCIATION);
    }

    // Same ambiguity from the parent side
    try {
        [[maybe_unused]] auto join = lib.node(lib.book)->join(lib.node(lib.loan));
        FAIL("Expected join to fail");
    } catch (const OrmError& e) {
        CHECK(e.category() == ErrorCategory::AMBIGUOUS_ASSOCIATION);
    }
}

TEST_CASE("JoinInference: explicit association disambiguates", "[join][inference]") {
    LibrarySchema lib;
    const auto& assoc = lib.loan->associations()[1];
    REQUIRE(assoc.child_column.name == "replacement_book_id");

    auto join = lib.node(lib.loan, "l")->join(lib.node(lib.book, "b"), assoc, JoinType::INNER);
    CHECK(std::dynamic_pointer_cast<ChildToParentJoin>(join) != nullptr);
    CHECK(join->conditions_expression() == "l.replacement_book_id = b.id");
    CHECK(join->join_type() == JoinType::INNER);

    // Given from the parent side the direction flips
    auto reverse = lib.node(lib.book, "b")->join(lib.node(lib.loan, "l"), assoc);
    CHECK(std::dynamic_pointer_cast<ParentToChildJoin>(reverse) != nullptr);
    CHECK(reverse->conditions_expression() == "l.replacement_book_id = b.id");
}

TEST_CASE("JoinInference: association that does not connect the nodes", "[join][inference]") {
    LibrarySchema lib;
    const auto& assoc = lib.loan->associations()[0];

    try {
        [[maybe_unused]] auto join = lib.node(lib.book)->join(lib.node(lib.category), assoc);
        FAIL("Expected join to fail");
    } catch (const OrmError& e) {
        CHECK(e.category() == ErrorCategory::INVALID_ASSOCIATION);
    }
}

TEST_CASE("JoinInference: try_join reports instead of throwing", "[join][inference]") {
    LibrarySchema lib;

    auto ok = lib.node(lib.book)->try_join(lib.node(lib.category));
    REQUIRE(ok.is_ok());
    CHECK(ok.value()->join_type() == JoinType::LEFT);

    auto missing = lib.node(lib.book)->try_join(lib.node(lib.author));
    REQUIRE(missing.is_error());
    CHECK(missing.error_category() == ErrorCategory::ASSOCIATION_NOT_FOUND);

    auto ambiguous = lib.node(lib.loan)->try_join(lib.node(lib.book), JoinType::INNER);
    REQUIRE(ambiguous.is_error());
    CHECK(ambiguous.error_category() == ErrorCategory::AMBIGUOUS_ASSOCIATION);
}

TEST_CASE("JoinInference: typed join helpers", "[join][inference]") {
    LibrarySchema lib;
    CHECK(lib.node(lib.book)->inner_join(lib.node(lib.category))->join_type() == JoinType::INNER);
    CHECK(lib.node(lib.book)->left_join(lib.node(lib.category))->join_type() == JoinType::LEFT);
    CHECK(lib.node(lib.book)->right_join(lib.node(lib.category))->join_type() == JoinType::RIGHT);
    CHECK(lib.node(lib.book)->full_join(lib.node(lib.category))->join_type() == JoinType::FULL);
}

TEST_CASE("JoinInference: chained joins resolve through the left-most relation", "[join][inference]") {
    LibrarySchema lib;
    // (loan -> book via explicit association) then book's category is reached
    // from the join, whose relation is loan; loan has no association to category.
    auto loan_book = lib.node(lib.loan, "l")->join(lib.node(lib.book, "b"), lib.loan->associations()[0]);
    CHECK(loan_book->relation_name() == "loan");
    CHECK_THROWS_AS(loan_book->join(lib.node(lib.category, "c")), OrmError);

    // Starting from book the chain works
    auto chain = lib.node(lib.book, "b")->join(lib.node(lib.category, "c"))
                     ->join(lib.node(lib.loan, "l"), lib.loan->associations()[0]);
    CHECK(std::dynamic_pointer_cast<ParentToChildJoin>(chain) != nullptr);
    CHECK(chain->conditions_expression() == "l.book_id = b.id");
}
