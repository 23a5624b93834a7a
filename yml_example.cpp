#include "include/yml.hpp"
#include <iostream>
#include <iomanip>

// Example YAML configuration
const char* example_config = R"(%YAML 1.2
%TAG !game! tag:example.com,2025:
---
# Game Configuration Example
# This showcases the YAML 1.2 features the engine understands

server:
  version: 2.1.5
  admin_contact: ops@example.com
  regions:
    - name: us-east
      address: game-us-east.example.com
      port: 7777
      active: true
    - name: eu-central
      address: game-eu.example.com
      port: 0x1E62
      active: false
  load_balancing: &lb
    strategy: round-robin
    health_check_interval: 30
    retry_attempts: 3

backup_server:
  load_balancing: *lb

characters:
  warrior: { base_hp: 150, speed: 1.0, skills: [slash, block, taunt] }
  mage:    { base_hp: 80,  speed: .85, skills: [fireball, ice_shield] }

motd: |
  Welcome, adventurer!
  Servers restart daily at 04:00.

lore: >-
  Long ago the realms
  were one.

  Then came the split.

spawn_point: !game!vector "10, 0, -4"
...
)";

void print_separator(const std::string& title)
{
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

void print_diagnostics(const yml::parse_context& ctx)
{
    for (const auto& w : ctx.warnings)
        std::cerr << "  " << w << "\n";
    for (const auto& e : ctx.errors)
        std::cerr << "  " << e << "\n";
}

std::string_view kind_name(yml::node_kind kind)
{
    switch (kind)
    {
        case yml::node_kind::null:     return "null";
        case yml::node_kind::boolean:  return "bool";
        case yml::node_kind::integer:  return "int";
        case yml::node_kind::decimal:  return "float";
        case yml::node_kind::string:   return "str";
        case yml::node_kind::sequence: return "seq";
        case yml::node_kind::mapping:  return "map";
        case yml::node_kind::alias:    return "alias";
    }
    return "?";
}

void print_scalar(yml::document::node_view node)
{
    if (auto b = node.as_bool())
        std::cout << (*b ? "true" : "false");
    else if (auto i = node.as_integer())
        std::cout << *i;
    else if (auto d = node.as_decimal())
        std::cout << *d;
    else if (auto s = node.as_string())
        std::cout << std::quoted(std::string(*s));
    else
        std::cout << "~";
}

void print_tree(yml::document::node_view node, int depth)
{
    std::string pad(static_cast<size_t>(depth) * 2, ' ');

    if (node.is_alias())
    {
        std::cout << "*" << node.resolved().anchor() << "\n";
        return;
    }

    if (node.is_scalar())
    {
        print_scalar(node);
        std::cout << "  (" << kind_name(node.kind()) << ", line " << node.location().line << ")\n";
        return;
    }

    std::cout << "<" << kind_name(node.kind()) << ", " << node.size() << " entries";
    if (!node.anchor().empty())
        std::cout << ", &" << node.anchor();
    std::cout << ">\n";

    if (node.is_sequence())
    {
        for (size_t i = 0; i < node.size(); ++i)
        {
            std::cout << pad << "- ";
            print_tree(*node.at(i), depth + 1);
        }
        return;
    }

    for (const auto& pair : node.pairs())
    {
        auto key = *node.doc->node(pair.key);
        std::cout << pad << key.text() << ": ";
        print_tree(*node.doc->node(pair.value), depth + 1);
    }
}

void test_parsing()
{
    print_separator("TEST 1: Basic Parsing");

    auto result = yml::parse(example_config);

    if (result.has_errors())
    {
        std::cout << "✗ Parse failed with errors:\n";
        print_diagnostics(result);
        return;
    }

    const yml::document& doc = result.result.front();

    std::cout << "✓ Parsed " << result.result.size() << " document(s), "
              << doc.node_count() << " nodes, YAML "
              << doc.version().major << "." << doc.version().minor << "\n\n";

    print_tree(*doc.root(), 1);
}

void test_queries()
{
    print_separator("TEST 2: Queries");

    auto result = yml::parse(example_config);
    if (result.has_errors())
    {
        std::cout << "✗ Parse failed\n";
        return;
    }

    auto root = *result.result.front().root();

    auto server = root.find("server");
    auto version = server ? server->find("version") : std::nullopt;
    auto regions = server ? server->find("regions") : std::nullopt;

    std::cout << "Server Configuration:\n";
    std::cout << "  Version: " << (version ? version->text() : "N/A") << "\n";
    std::cout << "  Regions: " << (regions ? regions->size() : 0) << "\n";

    if (regions)
    {
        for (const auto& id : regions->items())
        {
            auto region = *result.result.front().node(id);
            auto name = region.find("name");
            auto port = region.find("port");
            std::cout << "    " << std::left << std::setw(12) << (name ? name->text() : "?")
                      << " port " << (port && port->as_integer() ? *port->as_integer() : 0) << "\n";
        }
    }

    auto primary = server ? server->find("load_balancing") : std::nullopt;
    auto backup = root.find("backup_server");
    auto shared = backup ? backup->find("load_balancing") : std::nullopt;
    if (primary && shared)
    {
        std::cout << "  Backup shares load balancing: "
                  << (yml::deep_equal(*primary, *shared) ? "yes" : "no") << "\n";
    }

    if (auto spawn = root.find("spawn_point"))
        std::cout << "  Spawn point tag: " << spawn->tag() << "\n";

    if (auto lore = root.find("lore"))
        std::cout << "  Lore: " << std::quoted(std::string(lore->text())) << "\n";
}

void test_multi_document()
{
    print_separator("TEST 3: Document Streams");

    const char* stream = R"(
--- first
--- [second, document]
...
%YAML 1.1
--- { third: 3 }
)";

    auto result = yml::parse(stream);
    if (result.has_errors())
    {
        std::cout << "✗ Parse failed\n";
        print_diagnostics(result);
        return;
    }

    std::cout << "✓ " << result.result.size() << " documents\n";
    for (const auto& doc : result.result)
    {
        std::cout << "  YAML " << doc.version().major << "." << doc.version().minor
                  << (doc.explicit_end() ? " (closed) " : " ") << ": ";
        print_tree(*doc.root(), 2);
    }
}

void test_error_handling()
{
    print_separator("TEST 4: Error Handling");

    const char* broken[] = {
        "key: [unterminated\n",
        "a: 1\n  b: 2\n",
        "value: \"bad \\q escape\"\n",
        "ref: *missing\n",
        "a: 1\n%YAML 1.2\n---\nb: 2\n",
    };

    for (const char* src : broken)
    {
        auto result = yml::parse(src);
        if (result.has_errors())
        {
            std::cout << "✓ Rejected:\n";
            print_diagnostics(result);
        }
        else
        {
            std::cout << "✗ Expected a parse error but got none\n";
        }
    }

    auto warned = yml::parse("%FOO bar\n--- !!int twelve\n");
    if (warned.has_warnings() && !warned.has_errors())
    {
        std::cout << "\n✓ Warnings reported (" << warned.warnings.size() << "):\n";
        print_diagnostics(warned);
    }
}

int main()
{
    std::cout << R"(
  _   _ _ __ ___ | |
 | | | | '_ ` _ \| |
 | |_| | | | | | | |
  \__, |_| |_| |_|_|
  |___/

YAML 1.2 Grammar Engine - Example
Version 0.3.0
)" << std::endl;

    try
    {
        test_parsing();
        test_queries();
        test_multi_document();
        test_error_handling();

        print_separator("ALL EXAMPLES COMPLETED");
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n✗ Example failed with exception: " << e.what() << "\n";
        return 1;
    }
}
