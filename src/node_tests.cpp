#include <catch2/catch.hpp>
#include "node.hpp"

#include "structure.hpp"
#include "test_tree.hpp"
#include "token.hpp"

using namespace rx;
using namespace rx::test;

TEST_CASE("node_make", "[node]")
{
    auto a = lit("a");
    auto b = lit("b");
    element_t* const a_ptr = a.get();
    element_t* const b_ptr = b.get();

    auto node = node_t::make(make_element_list(std::move(a), std::move(b)));
    REQUIRE(node);
    REQUIRE(node->kind() == KIND_NODE);
    REQUIRE(node->parent() == nullptr);
    REQUIRE(a_ptr->parent() == node.get());
    REQUIRE(b_ptr->parent() == node.get());
    REQUIRE(node->num_children() == 2);

    element_vec_t const kids = node->children();
    REQUIRE(kids.size() == 2);
    REQUIRE(kids[0] == a_ptr);
    REQUIRE(kids[1] == b_ptr);
    REQUIRE(node->elements() == kids);
}

TEST_CASE("node_make_refused", "[node]")
{
    element_list_t list;
    list.push_back(lit("a"));
    list.push_back(nullptr);
    list.push_back(lit("b"));
    REQUIRE(!node_t::make(std::move(list)));

    REQUIRE(!token_t::make(KIND_STRUCTURE, "("));
    REQUIRE(!token_t::make(KIND_TOKEN, "x"));
    REQUIRE(!structure_t::make(KIND_STRUCTURE_CAPTURE, nullptr, nullptr, {}, nullptr));
    REQUIRE(!capture_t::make_named("", nullptr, nullptr, {}, nullptr));
}

TEST_CASE("token_to_string", "[node]")
{
    REQUIRE(lit("a")->to_string() == "{ Token::Literal, \"a\", 5.006, undef }");
    REQUIRE(versioned("5.010", "5.018")->to_string() == "{ Token::Assertion, \"\\K\", 5.010, 5.018 }");
    REQUIRE(!ws()->significant());
    REQUIRE(!make_comment("#")->significant());
    REQUIRE(make_unknown("?")->significant());
}

TEST_CASE("node_child", "[node]")
{
    auto node = node_t::make(make_element_list(lit("a"), ws(), lit("b")));

    REQUIRE(node->child()->content() == "a");
    REQUIRE(node->child(1)->content() == " ");
    REQUIRE(node->child(2)->content() == "b");
    REQUIRE(node->child(3) == nullptr);
    REQUIRE(node->child(-1)->content() == "b");
    REQUIRE(node->child(-3)->content() == "a");
    REQUIRE(node->child(-4) == nullptr);

    REQUIRE(node->first_element() == node->child(0));
    REQUIRE(node->last_element() == node->child(2));

    auto empty = node_t::make({});
    REQUIRE(empty->num_children() == 0);
    REQUIRE(empty->child() == nullptr);
    REQUIRE(empty->first_element() == nullptr);
    REQUIRE(empty->last_element() == nullptr);
    REQUIRE(empty->content() == "");
}

TEST_CASE("node_content", "[node]")
{
    auto node = regexp(make_element_list(
        lit("a"), capture(make_element_list(lit("b"), ws(), lit("c"))), lit("d")));

    REQUIRE(node->content() == "/a(b c)d/");
    REQUIRE(node->child(1)->content() == "(b c)");
}

TEST_CASE("node_contains", "[node]")
{
    auto deep = lit("x");
    element_t* const deep_ptr = deep.get();
    auto inner = capture(make_element_list(std::move(deep)));
    capture_t* const inner_ptr = inner.get();
    auto root = node_t::make(make_element_list(lit("a"), std::move(inner)));

    REQUIRE(root->contains(deep_ptr));
    REQUIRE(root->contains(inner_ptr));
    REQUIRE(root->contains(root->child(0)));
    REQUIRE(inner_ptr->contains(deep_ptr));
    REQUIRE(inner_ptr->contains(inner_ptr->start()));

    REQUIRE(!root->contains(root.get()));
    REQUIRE(!inner_ptr->contains(root.get()));
    REQUIRE(!inner_ptr->contains(root->child(0)));
    REQUIRE(!root->contains(nullptr));

    auto other = node_t::make(make_element_list(lit("x")));
    REQUIRE(!root->contains(other->child(0)));

    REQUIRE(root->ancestor_of(root.get()));
    REQUIRE(root->ancestor_of(deep_ptr));
    REQUIRE(!deep_ptr->ancestor_of(root.get()));
    REQUIRE(deep_ptr->descendant_of(root.get()));
    REQUIRE(deep_ptr->descendant_of(deep_ptr));
    REQUIRE(!root->descendant_of(inner_ptr));
    REQUIRE(deep_ptr->top() == root.get());
    REQUIRE(root->top() == root.get());
}

TEST_CASE("node_schild", "[node]")
{
    auto node = node_t::make(make_element_list(
        ws(), lit("a"), ws(), lit("b"), make_comment("# x\n"), lit("c"), ws()));

    REQUIRE(node->num_children() == 7);
    REQUIRE(node->num_schildren() == 3);

    element_vec_t const sig = node->schildren();
    REQUIRE(sig.size() == 3);
    REQUIRE(sig[0]->content() == "a");
    REQUIRE(sig[1]->content() == "b");
    REQUIRE(sig[2]->content() == "c");

    REQUIRE(node->schild() == sig[0]);
    REQUIRE(node->schild(0) == sig[0]);
    REQUIRE(node->schild(1) == sig[1]);
    REQUIRE(node->schild(2) == sig[2]);
    REQUIRE(node->schild(3) == nullptr);

    REQUIRE(node->schild(-1) == sig[2]);
    REQUIRE(node->schild(-2) == sig[1]);
    REQUIRE(node->schild(-3) == sig[0]);
    REQUIRE(node->schild(-4) == nullptr);

    auto empty = node_t::make({});
    REQUIRE(empty->schild(0) == nullptr);
    REQUIRE(empty->schild(-1) == nullptr);
    REQUIRE(empty->num_schildren() == 0);
}

TEST_CASE("node_schildren_count", "[node]")
{
    auto all = node_t::make(make_element_list(lit("a"), lit("b"), lit("c")));
    REQUIRE(all->num_children() == all->num_schildren());
    REQUIRE(all->children() == all->schildren());

    auto one_ws = node_t::make(make_element_list(lit("a"), ws(), lit("c")));
    REQUIRE(one_ws->num_schildren() == one_ws->num_children() - 1);
}

TEST_CASE("node_tokens", "[node]")
{
    auto root = regexp(make_element_list(
        lit("a"), group(make_element_list(lit("b"), capture(make_element_list(lit("c")))))));

    element_vec_t const tokens = root->tokens();
    std::string joined;
    for(element_t const* token : tokens)
    {
        REQUIRE(token->isa(KIND_TOKEN));
        joined += token->content();
    }
    REQUIRE(joined == root->content());
    REQUIRE(tokens.size() == 10);
}

TEST_CASE("structure_elements", "[node][structure]")
{
    auto body = lit("x");
    element_t* const body_ptr = body.get();
    auto node = group(make_element_list(std::move(body)));

    REQUIRE(node->num_children() == 1);
    REQUIRE(node->child(0) == body_ptr);
    REQUIRE(node->elements().size() == 4);
    REQUIRE(node->first_element() == node->start());
    REQUIRE(node->last_element() == node->finish());
    REQUIRE(node->start()->content() == "(");
    REQUIRE(node->start(-1) == node->start());
    REQUIRE(node->start(1) == nullptr);
    REQUIRE(node->type()->content() == "?:");
    REQUIRE(node->finish()->content() == ")");
    REQUIRE(node->start()->parent() == node.get());
    REQUIRE(node->finish()->parent() == node.get());

    auto bare = regexp({});
    REQUIRE(bare->type() == nullptr);
    REQUIRE(bare->elements().size() == 2);
    REQUIRE(bare->content() == "//");
}

TEST_CASE("node_nav", "[node][nav]")
{
    auto root = regexp(make_element_list(
        lit("a"), capture(make_element_list(lit("b"), lit("c"))), lit("d")));
    structure_t* const cap = dynamic_cast<structure_t*>(root->child(1));
    REQUIRE(cap);
    element_t* const c = cap->child(1);

    REQUIRE(root->child_nav(*cap) == nav_step_t{ NAV_CHILD, 1 });
    REQUIRE(cap->child_nav(*c) == nav_step_t{ NAV_CHILD, 1 });
    REQUIRE(root->child_nav(*root->start()) == nav_step_t{ NAV_START, 0 });
    REQUIRE(root->child_nav(*root->finish()) == nav_step_t{ NAV_FINISH, 0 });
    REQUIRE(!root->child_nav(*c));
    REQUIRE(!root->child_nav(*root));

    REQUIRE(!root->my_index());
    REQUIRE(root->nav().empty());
    REQUIRE(c->my_index() == nav_step_t{ NAV_CHILD, 1 });

    nav_path_t const path = c->nav();
    REQUIRE(path.size() == 2);
    REQUIRE(to_string(path) == "child(1) child(1)");
    REQUIRE(root->follow(path) == c);
    REQUIRE(root->follow(cap->finish()->nav()) == cap->finish());
    REQUIRE(root->follow({}) == root.get());

    nav_path_t bad = path;
    bad.back().index = 5;
    REQUIRE(root->follow(bad) == nullptr);
    bad.push_back({ NAV_CHILD, 0 });
    REQUIRE(root->follow(bad) == nullptr);
}

TEST_CASE("node_siblings", "[node][nav]")
{
    auto root = node_t::make(make_element_list(lit("a"), ws(), lit("b"), ws()));
    element_t* const a = root->child(0);
    element_t* const space = root->child(1);
    element_t* const b = root->child(2);
    element_t* const last = root->child(3);

    REQUIRE(a->next_sibling() == space);
    REQUIRE(a->previous_sibling() == nullptr);
    REQUIRE(b->previous_sibling() == space);
    REQUIRE(last->next_sibling() == nullptr);

    REQUIRE(a->snext_sibling() == b);
    REQUIRE(b->sprevious_sibling() == a);
    REQUIRE(b->snext_sibling() == nullptr);
    REQUIRE(a->sprevious_sibling() == nullptr);

    REQUIRE(root->next_sibling() == nullptr);
    REQUIRE(root->snext_sibling() == nullptr);

    auto cap = capture(make_element_list(lit("x")));
    REQUIRE(cap->start()->next_sibling() == nullptr);
    REQUIRE(cap->start()->snext_sibling() == nullptr);
}
