#ifndef YML_TESTS_PARSER__
#define YML_TESTS_PARSER__

#include "yml_test_harness.hpp"
#include "yml_test_helpers.hpp"

#include <sstream>

namespace yml::tests
{
    using namespace std::string_literals;

//------------------------------------------
// HELPERS
//------------------------------------------

    // Every block child sits at least one column right of its parent. A
    // block sequence directly under a mapping key may share the key's column.
    inline bool indentation_is_monotone(document::node_view parent)
    {
        if (parent.style() == node_style::flow)
            return true;

        auto child_ok = [&](node_id id, bool mapping_value)
        {
            auto child = *parent.doc->node(id);
            if (child.is_alias())
                return true;

            int minimum = parent.indent() + 1;
            if (mapping_value && child.is_sequence() && child.style() == node_style::block)
                minimum = parent.indent();
            return child.indent() >= minimum && indentation_is_monotone(child);
        };

        for (auto id : parent.items())
        {
            if (!child_ok(id, false))
                return false;
        }
        for (auto const & p : parent.pairs())
        {
            if (!child_ok(p.key, false) || !child_ok(p.value, true))
                return false;
        }
        return true;
    }

//------------------------------------------
// Scenarios
//------------------------------------------

static bool parser_flat_mapping()
{
    auto ctx = parse("a: 1\nb: 2\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(ctx.result.size() == 1, "one document");

    auto root = root_of(ctx);
    EXPECT(root.is_mapping() && root.size() == 2, "mapping with two entries");

    auto first = root.pairs()[0];
    auto second = root.pairs()[1];
    EXPECT(string_is(*root.doc->node(first.key), "a"), "first key is 'a'");
    EXPECT(string_is(*root.doc->node(second.key), "b"), "second key is 'b'");

    auto one = *root.doc->node(first.value);
    EXPECT(integer_is(one, 1), "first value is 1");
    EXPECT(one.tag() == "tag:yaml.org,2002:int", "integer tagged");
    EXPECT(integer_is(*root.doc->node(second.value), 2), "second value is 2");
    return true;
}

static bool parser_nested_sequence()
{
    auto ctx = parse("- - 1\n  - 2\n- 3\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");

    auto root = root_of(ctx);
    EXPECT(root.is_sequence() && root.size() == 2, "sequence of two elements");

    auto inner = *root.at(0);
    EXPECT(inner.is_sequence() && inner.size() == 2, "first element is a two-element sequence");
    EXPECT(integer_is(*inner.at(0), 1) && integer_is(*inner.at(1), 2), "inner elements 1 and 2");
    EXPECT(integer_is(*root.at(1), 3), "second element is 3");
    return true;
}

static bool parser_literal_strip()
{
    auto ctx = parse("v: |-\n  line1\n  line2\n\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(string_is(value_of(ctx, "v"), "line1\nline2"), "no trailing break");
    EXPECT(value_of(ctx, "v").style() == node_style::literal, "literal style");
    return true;
}

static bool parser_explicit_document_boundary()
{
    auto ctx = parse("---\na: 1\n...\n---\nb: 2\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(ctx.result.size() == 2, "two documents");
    EXPECT(ctx.result[0].explicit_end(), "first document closed by '...'");
    EXPECT(integer_is(*root_of(ctx, 1).find("b"), 2), "second document holds b: 2");
    return true;
}

//------------------------------------------
// Properties
//------------------------------------------

static bool parser_alias_yields_equal_value()
{
    auto ctx = parse("a: &a 1\nb: [x, *a]\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");

    auto anchored = value_of(ctx, "a");
    auto alias = *value_of(ctx, "b").at(1);
    EXPECT(alias.is_alias(), "alias node kept as an alias");
    EXPECT(deep_equal(anchored, alias), "alias equals the anchored value");
    EXPECT(!deep_equal(anchored, *value_of(ctx, "b").at(0)), "and differs from other nodes");
    return true;
}

static bool parser_alias_of_nan_equals_anchor()
{
    auto ctx = parse("a: &n .nan\nb: *n\nc: .nan\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(deep_equal(value_of(ctx, "a"), value_of(ctx, "b")), "an alias of NaN is its own anchor");
    EXPECT(!deep_equal(value_of(ctx, "a"), value_of(ctx, "c")), "a separate NaN still compares unequal");
    return true;
}

static bool parser_alias_in_fresh_document()
{
    auto ctx = parse("a: &a 1\n---\nb: *a\n");
    EXPECT(failed_at(ctx, scan_error_kind::unknown_anchor, 3, 4), "anchors do not outlive their document");
    return true;
}

static bool parser_anchor_redefinition()
{
    auto ctx = parse("- &a 1\n- *a\n- &a 2\n- *a\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");

    auto root = root_of(ctx);
    EXPECT(integer_is(*root.at(1), 1), "first alias sees the first anchor");
    EXPECT(integer_is(*root.at(3), 2), "second alias sees the redefinition");
    return true;
}

static bool parser_tag_prefix_resolution()
{
    auto ctx = parse("%TAG !e! tag:example.com,2000:\n---\n!e!foo bar\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(root_of(ctx).tag() == "tag:example.com,2000:foo", "shorthand expanded");
    EXPECT(ctx.result.front().tags().prefix_of("!e!") == "tag:example.com,2000:", "prefix kept on the document");
    return true;
}

static bool parser_secondary_handle()
{
    auto ctx = parse("a: !!float 1\nb: !local x\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(value_of(ctx, "a").kind() == node_kind::decimal, "!!float converts");
    EXPECT(value_of(ctx, "b").tag() == "!local", "primary handle keeps '!'");
    return true;
}

static bool parser_directive_after_content()
{
    auto ctx = parse("a: 1\n%TAG !e! tag:example.com,2000:\n---\nb: 2\n");
    EXPECT(failed_at(ctx, scan_error_kind::directive_after_content, 2, 1), "%TAG after content must fail");

    auto ok = parse("a: 1\n...\n%TAG !e! tag:example.com,2000:\n---\nb: !e!x 2\n");
    EXPECT(!ok.has_errors(), "the same directive after '...' is legal");
    return true;
}

//------------------------------------------
// Indentation
//------------------------------------------

static bool parser_indentation_monotonicity()
{
    auto ctx = parse(
        "a:\n"
        "  b:\n"
        "  - c\n"
        "  - d: |\n"
        "      text\n"
        "    e: [f, g]\n"
        "h:\n"
        "    deep: 1\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(indentation_is_monotone(root_of(ctx)), "every child is indented past its parent");

    auto b = *value_of(ctx, "a").find("b");
    EXPECT(b.is_sequence() && b.indent() == 2, "compact sequence at the key's column");
    EXPECT(value_of(ctx, "h").indent() == 4, "mapping records its own column");
    return true;
}

//------------------------------------------
// Schema options
//------------------------------------------

static bool parser_core_schema_default()
{
    auto ctx = parse("[~, true, 0x10, 1.5, .inf, text]\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");

    auto root = root_of(ctx);
    EXPECT(root.at(0)->is_null(), "~ is null");
    EXPECT(root.at(1)->as_bool() == true, "true is a boolean");
    EXPECT(integer_is(*root.at(2), 16), "hex integer");
    EXPECT(root.at(3)->as_decimal() == 1.5, "decimal");
    EXPECT(root.at(4)->kind() == node_kind::decimal, "infinity");
    EXPECT(string_is(*root.at(5), "text"), "string");
    return true;
}

static bool parser_json_schema_option()
{
    parser_options opts;
    opts.schema = schema_kind::json;

    auto ctx = parse("[null, True, 1, ~]\n", opts);
    EXPECT(!ctx.has_errors(), "parse must succeed");

    auto root = root_of(ctx);
    EXPECT(root.at(0)->is_null(), "null");
    EXPECT(string_is(*root.at(1), "True"), "only lower-case booleans in JSON");
    EXPECT(integer_is(*root.at(2), 1), "integer");
    EXPECT(string_is(*root.at(3), "~"), "'~' is text in JSON");
    return true;
}

static bool parser_failsafe_schema_option()
{
    parser_options opts;
    opts.schema = schema_kind::failsafe;

    auto ctx = parse("a: 1\n", opts);
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(string_is(value_of(ctx, "a"), "1"), "failsafe keeps text");
    return true;
}

//------------------------------------------
// Encodings
//------------------------------------------

static bool parser_reads_utf16_with_bom()
{
    auto ctx = parse("\xFF\xFE" "a\0:\0 \0" "1\0\n\0"s);
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(integer_is(value_of(ctx, "a"), 1), "a: 1");
    return true;
}

static bool parser_reads_utf32_without_bom()
{
    auto ctx = parse("x\0\0\0"s);
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(string_is(root_of(ctx), "x"), "single scalar");
    return true;
}

static bool parser_unicode_content()
{
    auto ctx = parse("k\xC3\xA9y: \xE2\x82\xAC 5\n");
    EXPECT(!ctx.has_errors(), "parse must succeed");
    EXPECT(string_is(value_of(ctx, "k\xC3\xA9y"), "\xE2\x82\xAC 5"), "non-ASCII text round-trips as UTF-8");
    return true;
}

static bool parser_rejects_invalid_encoding()
{
    auto ctx = parse("a: \xFF\n");
    EXPECT(failed_at(ctx, scan_error_kind::invalid_encoding, 1, 4), "undecodable byte must fail at its position");
    EXPECT(ctx.errors.front().loc.offset == 3, "byte offset of the bad byte");
    return true;
}

static bool parser_rejects_non_printable()
{
    auto ctx = parse("a: 1\nb: \x01\n");
    EXPECT(failed_at(ctx, scan_error_kind::unexpected_character, 2, 4), "control character must fail at its position");
    return true;
}

//------------------------------------------
// Diagnostics
//------------------------------------------

static bool parser_failure_discards_documents()
{
    auto ctx = parse("a\n---\nb: [\n");
    EXPECT(ctx.result.empty(), "no partial results");
    EXPECT(ctx.errors.size() == 1, "exactly one error");
    return true;
}

static bool parser_warnings_survive_failure()
{
    auto ctx = parse("%FOO\n---\n[\n");
    EXPECT(ctx.has_errors(), "the document is broken");
    EXPECT(ctx.warnings.size() == 1 && ctx.warnings.front().kind == scan_error_kind::unknown_directive,
           "earlier warnings are still reported");
    return true;
}

static bool parser_formats_diagnostics()
{
    auto ctx = parse("a: 1\nb: 'x\n");
    EXPECT(ctx.has_errors(), "parse must fail");

    std::ostringstream os;
    os << ctx.errors.front();
    EXPECT(os.str().rfind("2:4: error: unterminated scalar: ", 0) == 0, "line:column: error: kind: message");

    EXPECT(is_warning(scan_error_kind::tag_mismatch), "tag_mismatch is a warning");
    EXPECT(!is_warning(scan_error_kind::unknown_anchor), "unknown_anchor is fatal");
    return true;
}

static bool parser_load_file_reports_unreadable_input()
{
    auto ctx = load_file("/nonexistent/yml/input.yaml");
    EXPECT(failed_with(ctx, scan_error_kind::unreadable_input), "missing file must fail");
    return true;
}

//------------------------------------------

inline void run_parser_tests()
{
    SUBCAT("Scenarios");
    RUN_TEST(parser_flat_mapping);
    RUN_TEST(parser_nested_sequence);
    RUN_TEST(parser_literal_strip);
    RUN_TEST(parser_explicit_document_boundary);

    SUBCAT("Properties");
    RUN_TEST(parser_alias_yields_equal_value);
    RUN_TEST(parser_alias_of_nan_equals_anchor);
    RUN_TEST(parser_alias_in_fresh_document);
    RUN_TEST(parser_anchor_redefinition);
    RUN_TEST(parser_tag_prefix_resolution);
    RUN_TEST(parser_secondary_handle);
    RUN_TEST(parser_directive_after_content);

    SUBCAT("Indentation");
    RUN_TEST(parser_indentation_monotonicity);

    SUBCAT("Schema options");
    RUN_TEST(parser_core_schema_default);
    RUN_TEST(parser_json_schema_option);
    RUN_TEST(parser_failsafe_schema_option);

    SUBCAT("Encodings");
    RUN_TEST(parser_reads_utf16_with_bom);
    RUN_TEST(parser_reads_utf32_without_bom);
    RUN_TEST(parser_unicode_content);
    RUN_TEST(parser_rejects_invalid_encoding);
    RUN_TEST(parser_rejects_non_printable);

    SUBCAT("Diagnostics");
    RUN_TEST(parser_failure_discards_documents);
    RUN_TEST(parser_warnings_survive_failure);
    RUN_TEST(parser_formats_diagnostics);
    RUN_TEST(parser_load_file_reports_unreadable_input);
}

} // ns yml::tests

#endif
