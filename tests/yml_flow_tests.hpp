#ifndef YML_TESTS_FLOW__
#define YML_TESTS_FLOW__

#include "yml_test_harness.hpp"
#include "yml_test_helpers.hpp"

namespace yml::tests
{

//------------------------------------------
// Quoted scalars
//------------------------------------------

static bool flow_double_quoted_escapes()
{
    auto ctx = parse("v: \"a\\tb\\u00e9\\x41\"\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(string_is(value_of(ctx, "v"), "a\tb\xC3\xA9" "A"), "escapes decoded to UTF-8");
    EXPECT(value_of(ctx, "v").style() == node_style::double_quoted, "style recorded");
    return true;
}

static bool flow_double_quoted_folding()
{
    auto ctx = parse("v: \"one   \n    two\n\n    three\"\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(string_is(value_of(ctx, "v"), "one two\nthree"), "breaks fold, trailing white space dropped");
    return true;
}

static bool flow_double_quoted_escaped_break()
{
    auto ctx = parse("v: \"ab\\\n    cd\"\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(string_is(value_of(ctx, "v"), "abcd"), "an escaped break joins the lines");
    return true;
}

static bool flow_single_quoted_doubling()
{
    auto ctx = parse("v: 'it''s \\n'\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(string_is(value_of(ctx, "v"), "it's \\n"), "'' is a quote, backslash is literal");
    return true;
}

static bool flow_quoted_digits_stay_strings()
{
    auto ctx = parse("v: '12'\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(string_is(value_of(ctx, "v"), "12"), "quoted digits are a string");
    return true;
}

static bool flow_quoted_implicit_key()
{
    auto ctx = parse("\"a b\": 1\n'c': 2\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(integer_is(value_of(ctx, "a b"), 1), "double-quoted key");
    EXPECT(integer_is(value_of(ctx, "c"), 2), "single-quoted key");
    return true;
}

static bool flow_rejects_invalid_escape()
{
    auto ctx = parse("v: \"a\\qb\"\n");
    EXPECT(failed_at(ctx, scan_error_kind::invalid_escape, 1, 6), "\\q must be rejected at the backslash");
    return true;
}

static bool flow_rejects_unterminated_quote()
{
    auto ctx = parse("a: 1\nb: 'x\n");
    EXPECT(failed_at(ctx, scan_error_kind::unterminated_scalar, 2, 4), "error points at the opening quote");
    EXPECT(ctx.errors.front().loc.offset == 8, "byte offset of the opening quote");
    return true;
}

static bool flow_rejects_under_indented_quoted_line()
{
    auto ctx = parse("a:\n  b: \"x\n y\"\n");
    EXPECT(failed_with(ctx, scan_error_kind::unexpected_indentation), "continuation below the node's indentation");
    return true;
}

//------------------------------------------
// Flow collections
//------------------------------------------

static bool flow_nested_collections()
{
    auto ctx = parse("[a, [b, c], {d: e}]\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");

    auto root = root_of(ctx);
    EXPECT(root.is_sequence() && root.size() == 3, "three entries");
    EXPECT(root.style() == node_style::flow, "flow style recorded");
    EXPECT(root.at(1)->is_sequence() && root.at(1)->size() == 2, "nested sequence");
    EXPECT(string_is(*root.at(2)->find("d"), "e"), "nested mapping");
    return true;
}

static bool flow_mapping_values()
{
    auto ctx = parse("{a: 1, b: [2, 3], \"c\":4, d}\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");

    auto root = root_of(ctx);
    EXPECT(root.is_mapping() && root.size() == 4, "four entries");
    EXPECT(integer_is(*root.find("c"), 4), "adjacent value after a quoted key");
    EXPECT(root.find("d")->is_null(), "a key without value is null");
    return true;
}

static bool flow_single_pair_in_sequence()
{
    auto ctx = parse("[a: 1, b]\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");

    auto root = root_of(ctx);
    EXPECT(root.size() == 2, "two entries");
    EXPECT(root.at(0)->is_mapping() && root.at(0)->size() == 1, "a single-pair mapping");
    EXPECT(integer_is(*root.at(0)->find("a"), 1), "a: 1");
    return true;
}

static bool flow_plain_scalars_with_spaces()
{
    auto ctx = parse("[a b, c:d, -e]\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");

    auto root = root_of(ctx);
    EXPECT(string_is(*root.at(0), "a b"), "inner space kept");
    EXPECT(string_is(*root.at(1), "c:d"), "':' without blank is content");
    EXPECT(string_is(*root.at(2), "-e"), "'-' followed by content starts a plain scalar");
    return true;
}

static bool flow_collection_across_lines()
{
    auto ctx = parse("k: [a,  # first\n  b,\n  c ]\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(value_of(ctx, "k").size() == 3, "lines and comments inside a flow sequence");
    return true;
}

static bool flow_trailing_comma()
{
    auto ctx = parse("[a, b,]\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(root_of(ctx).size() == 2, "a trailing comma adds nothing");
    return true;
}

static bool flow_empty_mapping_entry_is_null_pair()
{
    auto ctx = parse("{a: 1, , b: 2}\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");

    auto root = root_of(ctx);
    EXPECT(root.size() == 3, "three pairs");
    auto key = root.doc->node(root.pairs()[1].key);
    EXPECT(key && key->is_null(), "the empty entry has a null key");
    return true;
}

static bool flow_rejects_empty_sequence_entry()
{
    auto ctx = parse("[a,,b]\n");
    EXPECT(failed_at(ctx, scan_error_kind::unexpected_character, 1, 4), "empty sequence entry must fail");
    return true;
}

static bool flow_rejects_unterminated_collection()
{
    auto ctx = parse("[a, b\n");
    EXPECT(failed_with(ctx, scan_error_kind::expected_close_delimiter), "missing ']' must fail");
    return true;
}

static bool flow_rejects_missing_comma()
{
    auto ctx = parse("{a: 1 b: 2}\n");
    EXPECT(failed_with(ctx, scan_error_kind::expected_separation), "entries must be separated by ','");
    return true;
}

static bool flow_depth_limit()
{
    parser_options opts;
    opts.max_depth = 3;

    EXPECT(!parse("[[[a]]]\n", opts).has_errors(), "three levels fit");
    EXPECT(failed_with(parse("[[[[a]]]]\n", opts), scan_error_kind::depth_exceeded), "four levels exceed the limit");
    return true;
}

static bool flow_collection_as_key()
{
    auto ctx = parse("[a, b]: c\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");

    auto root = root_of(ctx);
    EXPECT(root.is_mapping() && root.size() == 1, "single entry mapping");
    auto key = root.doc->node(root.pairs()[0].key);
    EXPECT(key && key->is_sequence() && key->size() == 2, "the key is a flow sequence");
    return true;
}

//------------------------------------------
// Properties and aliases
//------------------------------------------

static bool flow_tags_and_anchors()
{
    auto ctx = parse("[!!str 1, &x !!int 2, *x, ! 3]\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");

    auto root = root_of(ctx);
    EXPECT(string_is(*root.at(0), "1"), "!!str keeps text");
    EXPECT(root.at(1)->anchor() == "x" && integer_is(*root.at(1), 2), "anchored integer");
    EXPECT(root.at(2)->is_alias() && integer_is(*root.at(2), 2), "alias resolves");
    EXPECT(root.at(3)->tag() == "!" && string_is(*root.at(3), "3"), "non-specific tag");
    return true;
}

static bool flow_verbatim_tag()
{
    auto ctx = parse("v: !<tag:example.com,2000:thing> x\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(value_of(ctx, "v").tag() == "tag:example.com,2000:thing", "verbatim tag kept as written");
    return true;
}

static bool flow_tag_mismatch_warns()
{
    auto ctx = parse("v: !!int abc\n");
    EXPECT(!ctx.has_errors(), "a mismatch is not fatal");
    EXPECT(ctx.warnings.size() == 1 && ctx.warnings.front().kind == scan_error_kind::tag_mismatch, "one warning");
    EXPECT(string_is(value_of(ctx, "v"), "abc"), "value kept as a string");
    EXPECT(value_of(ctx, "v").tag() == "tag:yaml.org,2002:int", "tag kept as written");
    return true;
}

static bool flow_rejects_undefined_alias()
{
    auto ctx = parse("a: *nope\n");
    EXPECT(failed_at(ctx, scan_error_kind::unknown_anchor, 1, 4), "undefined alias must fail at '*'");
    return true;
}

static bool flow_rejects_undefined_tag_handle()
{
    auto ctx = parse("a: !e!x 1\n");
    EXPECT(failed_at(ctx, scan_error_kind::unknown_tag_handle, 1, 4), "undeclared handle must fail");
    return true;
}

static bool flow_rejects_alias_with_properties()
{
    auto ctx = parse("a: &x 1\nb: !!str *x\n");
    EXPECT(failed_with(ctx, scan_error_kind::unexpected_character), "aliases cannot carry properties");
    return true;
}

//------------------------------------------

inline void run_flow_tests()
{
    SUBCAT("Quoted scalars");
    RUN_TEST(flow_double_quoted_escapes);
    RUN_TEST(flow_double_quoted_folding);
    RUN_TEST(flow_double_quoted_escaped_break);
    RUN_TEST(flow_single_quoted_doubling);
    RUN_TEST(flow_quoted_digits_stay_strings);
    RUN_TEST(flow_quoted_implicit_key);
    RUN_TEST(flow_rejects_invalid_escape);
    RUN_TEST(flow_rejects_unterminated_quote);
    RUN_TEST(flow_rejects_under_indented_quoted_line);

    SUBCAT("Flow collections");
    RUN_TEST(flow_nested_collections);
    RUN_TEST(flow_mapping_values);
    RUN_TEST(flow_single_pair_in_sequence);
    RUN_TEST(flow_plain_scalars_with_spaces);
    RUN_TEST(flow_collection_across_lines);
    RUN_TEST(flow_trailing_comma);
    RUN_TEST(flow_empty_mapping_entry_is_null_pair);
    RUN_TEST(flow_rejects_empty_sequence_entry);
    RUN_TEST(flow_rejects_unterminated_collection);
    RUN_TEST(flow_rejects_missing_comma);
    RUN_TEST(flow_depth_limit);
    RUN_TEST(flow_collection_as_key);

    SUBCAT("Properties and aliases");
    RUN_TEST(flow_tags_and_anchors);
    RUN_TEST(flow_verbatim_tag);
    RUN_TEST(flow_tag_mismatch_warns);
    RUN_TEST(flow_rejects_undefined_alias);
    RUN_TEST(flow_rejects_undefined_tag_handle);
    RUN_TEST(flow_rejects_alias_with_properties);
}

} // ns yml::tests

#endif
