// yml_document.hpp - yml YAML 1.2 grammar engine - Authoritative Document Model
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef YML_DOCUMENT_HPP
#define YML_DOCUMENT_HPP

#include "yml_core.hpp"

#include <span>
#include <unordered_map>
#include <unordered_set>

namespace yml
{
//========================================================================
// Node data
//========================================================================

    enum class node_kind
    {
        null,
        boolean,
        integer,
        decimal,
        string,
        sequence,
        mapping,
        alias
    };

    enum class node_style
    {
        plain,
        single_quoted,
        double_quoted,
        literal,
        folded,
        block,      // block collection
        flow        // flow collection
    };

    using scalar_value = std::variant<
        std::monostate,
        bool,
        int64_t,
        double,
        std::string
    >;

    struct node_pair
    {
        node_id key;
        node_id value;
    };

//========================================================================
// Directives
//========================================================================

    struct version_directive
    {
        int major = 1;
        int minor = 2;
    };

    struct tag_directive
    {
        std::string handle;
        std::string prefix;
    };

    using directive = std::variant<version_directive, tag_directive>;

//========================================================================
// tag_prefix_table
//========================================================================

    class tag_prefix_table
    {
    public:
        tag_prefix_table() { reset(); }

        // Returns false when the handle was already declared since the last
        // reset. The new prefix replaces the old one either way.
        bool declare(std::string const & handle, std::string const & prefix)
        {
            bool fresh = declared_.insert(handle).second;
            prefixes_[handle] = prefix;
            return fresh;
        }

        std::optional<std::string> prefix_of(std::string const & handle) const
        {
            if (auto it = prefixes_.find(handle); it != prefixes_.end())
                return it->second;
            return std::nullopt;
        }

        std::optional<std::string> resolve(std::string const & handle, std::string_view suffix) const
        {
            auto prefix = prefix_of(handle);
            if (!prefix)
                return std::nullopt;
            return *prefix + std::string(suffix);
        }

        void reset()
        {
            prefixes_.clear();
            declared_.clear();
            prefixes_["!"]  = "!";
            prefixes_["!!"] = std::string(detail::CORE_TAG_PREFIX);
        }

        size_t size() const noexcept { return prefixes_.size(); }

    private:
        std::unordered_map<std::string, std::string> prefixes_;
        std::unordered_set<std::string>              declared_;
    };

//========================================================================
// document
//========================================================================

    class document
    {
    public:
        //------------------------------------------------------------------------
        // Public, read-only views
        //------------------------------------------------------------------------

        struct node_view;

        //------------------------------------------------------------------------
        // Construction
        //------------------------------------------------------------------------

        document() = default;

        //------------------------------------------------------------------------
        // Node access
        //------------------------------------------------------------------------

        size_t node_count() const noexcept
        {
            return nodes_.size();
        }

        std::optional<node_view> root() const noexcept;

        std::optional<node_view> node(node_id id) const noexcept;

        //------------------------------------------------------------------------
        // Stream properties in effect for this document
        //------------------------------------------------------------------------

        version_directive version() const noexcept { return version_; }

        tag_prefix_table const & tags() const noexcept { return tags_; }

        std::span<const directive> directives() const noexcept { return directives_; }

        bool explicit_start() const noexcept { return explicit_start_; }
        bool explicit_end() const noexcept { return explicit_end_; }

    private:

        //------------------------------------------------------------------------
        // Internal storage (fully normalised)
        //------------------------------------------------------------------------

        struct node_record
        {
            node_id                id;
            node_kind              kind   = node_kind::null;
            node_style             style  = node_style::plain;
            std::string            tag;
            std::string            anchor;
            std::string            text;
            scalar_value           value;
            std::vector<node_id>   items;    // sequences
            std::vector<node_pair> pairs;    // mappings, authored order
            node_id                target;   // aliases
            source_location        loc;
            int                    indent = -1;
        };

        std::vector<node_record> nodes_;
        node_id                  root_;
        version_directive        version_;
        tag_prefix_table         tags_;
        std::vector<directive>   directives_;
        bool                     explicit_start_ = false;
        bool                     explicit_end_   = false;

        friend class document_builder;
    };

//========================================================================
// Views
//========================================================================

    struct document::node_view
    {
        const document*    doc;
        const node_record* node;

        node_id id() const noexcept { return node->id; }
        node_kind kind() const noexcept { return node->kind; }
        node_style style() const noexcept { return node->style; }
        std::string_view tag() const noexcept { return node->tag; }
        std::string_view anchor() const noexcept { return node->anchor; }
        std::string_view text() const noexcept { return node->text; }
        source_location location() const noexcept { return node->loc; }
        int indent() const noexcept { return node->indent; }

        bool is_null() const noexcept { return node->kind == node_kind::null; }
        bool is_sequence() const noexcept { return node->kind == node_kind::sequence; }
        bool is_mapping() const noexcept { return node->kind == node_kind::mapping; }
        bool is_alias() const noexcept { return node->kind == node_kind::alias; }
        bool is_scalar() const noexcept
        {
            return !is_sequence() && !is_mapping() && !is_alias();
        }

        // Follows alias references to the anchored node.
        node_view resolved() const noexcept
        {
            node_view v = *this;
            while (v.is_alias())
                v = node_view{ doc, &doc->nodes_[v.node->target.val] };
            return v;
        }

        size_t size() const noexcept
        {
            if (is_sequence()) return node->items.size();
            if (is_mapping())  return node->pairs.size();
            return 0;
        }

        std::span<const node_id> items() const noexcept
        {
            return node->items;
        }

        std::span<const node_pair> pairs() const noexcept
        {
            return node->pairs;
        }

        std::optional<node_view> at(size_t index) const noexcept
        {
            if (!is_sequence() || index >= node->items.size())
                return std::nullopt;
            return doc->node(node->items[index]);
        }

        // First mapping entry whose scalar key text equals `key`.
        std::optional<node_view> find(std::string_view key) const noexcept
        {
            if (!is_mapping())
                return std::nullopt;

            for (auto const & p : node->pairs)
            {
                auto k = doc->node(p.key);
                if (k && k->resolved().is_scalar() && k->resolved().text() == key)
                    return doc->node(p.value);
            }
            return std::nullopt;
        }

        std::optional<bool> as_bool() const noexcept
        {
            if (auto b = std::get_if<bool>(&node->value))
                return *b;
            return std::nullopt;
        }

        std::optional<int64_t> as_integer() const noexcept
        {
            if (auto i = std::get_if<int64_t>(&node->value))
                return *i;
            return std::nullopt;
        }

        std::optional<double> as_decimal() const noexcept
        {
            if (auto d = std::get_if<double>(&node->value))
                return *d;
            return std::nullopt;
        }

        std::optional<std::string_view> as_string() const noexcept
        {
            if (auto s = std::get_if<std::string>(&node->value))
                return std::string_view(*s);
            return std::nullopt;
        }
    };

//========================================================================
// document member implementations
//========================================================================

    inline std::optional<document::node_view>
    document::root() const noexcept
    {
        return node(root_);
    }

    inline std::optional<document::node_view>
    document::node(node_id id) const noexcept
    {
        if (id.val >= nodes_.size())
            return std::nullopt;

        return node_view{ this, &nodes_[id.val] };
    }

    // Structural equality of two subtrees after alias resolution.
    inline bool deep_equal(document::node_view a, document::node_view b)
    {
        a = a.resolved();
        b = b.resolved();

        // The same node, even when its value is NaN.
        if (a.doc == b.doc && a.id() == b.id())
            return true;

        if (a.kind() != b.kind() || a.tag() != b.tag())
            return false;

        switch (a.kind())
        {
            case node_kind::sequence:
                if (a.size() != b.size())
                    return false;
                for (size_t i = 0; i < a.size(); ++i)
                {
                    if (!deep_equal(*a.at(i), *b.at(i)))
                        return false;
                }
                return true;

            case node_kind::mapping:
                if (a.size() != b.size())
                    return false;
                for (size_t i = 0; i < a.size(); ++i)
                {
                    auto const & pa = a.pairs()[i];
                    auto const & pb = b.pairs()[i];
                    if (!deep_equal(*a.doc->node(pa.key), *b.doc->node(pb.key)) ||
                        !deep_equal(*a.doc->node(pa.value), *b.doc->node(pb.value)))
                        return false;
                }
                return true;

            default:
                return a.text() == b.text() && a.node->value == b.node->value;
        }
    }

//========================================================================
// document_builder
//
// Used by the grammar engine only. Nodes are addressed by id, so records
// may be appended while a parent collection is still open.
//========================================================================

    class document_builder
    {
    public:
        node_id add_scalar(node_kind kind, node_style style, std::string tag,
                           std::string text, scalar_value value,
                           source_location loc, int indent)
        {
            auto & rec = append(kind, style, std::move(tag), loc, indent);
            rec.text  = std::move(text);
            rec.value = std::move(value);
            return rec.id;
        }

        node_id open_sequence(node_style style, std::string tag, source_location loc, int indent)
        {
            return append(node_kind::sequence, style, std::move(tag), loc, indent).id;
        }

        node_id open_mapping(node_style style, std::string tag, source_location loc, int indent)
        {
            return append(node_kind::mapping, style, std::move(tag), loc, indent).id;
        }

        node_id add_alias(node_id target, std::string name, source_location loc, int indent)
        {
            auto & rec = append(node_kind::alias, node_style::plain, {}, loc, indent);
            rec.target = target;
            rec.text   = std::move(name);
            return rec.id;
        }

        void append_item(node_id sequence, node_id item)
        {
            doc_.nodes_.at(sequence.val).items.push_back(item);
        }

        void append_pair(node_id mapping, node_id key, node_id value)
        {
            doc_.nodes_.at(mapping.val).pairs.push_back({ key, value });
        }

        void set_anchor(node_id id, std::string anchor)
        {
            doc_.nodes_.at(id.val).anchor = std::move(anchor);
        }

        void set_root(node_id id) { doc_.root_ = id; }

        void set_version(version_directive v) { doc_.version_ = v; }
        void set_tags(tag_prefix_table const & tags) { doc_.tags_ = tags; }
        void set_directives(std::vector<directive> d) { doc_.directives_ = std::move(d); }
        void set_explicit_start(bool b) { doc_.explicit_start_ = b; }
        void set_explicit_end(bool b) { doc_.explicit_end_ = b; }

        size_t node_count() const noexcept { return doc_.nodes_.size(); }

        document finish()
        {
            document out = std::move(doc_);
            doc_ = document{};
            return out;
        }

    private:
        document::node_record & append(node_kind kind, node_style style, std::string tag,
                                       source_location loc, int indent)
        {
            document::node_record rec;
            rec.id     = node_id{ doc_.nodes_.size() };
            rec.kind   = kind;
            rec.style  = style;
            rec.tag    = std::move(tag);
            rec.loc    = loc;
            rec.indent = indent;
            doc_.nodes_.push_back(std::move(rec));
            return doc_.nodes_.back();
        }

        document doc_;
    };

} // namespace yml

#endif // YML_DOCUMENT_HPP
