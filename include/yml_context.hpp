// yml_context.hpp - yml YAML 1.2 grammar engine - Parametric Context
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef YML_CONTEXT_HPP
#define YML_CONTEXT_HPP

#include "yml_cursor.hpp"

namespace yml
{
//========================================================================
// Grammar parameters
//========================================================================

    enum class context_kind
    {
        block_in,
        block_out,
        block_key,
        flow_in,
        flow_out,
        flow_key
    };

    struct parametric_context
    {
        int          indent;
        context_kind kind;
    };

    inline constexpr bool is_flow(context_kind c) noexcept
    {
        return c == context_kind::flow_in || c == context_kind::flow_out || c == context_kind::flow_key;
    }

    inline constexpr bool is_key_context(context_kind c) noexcept
    {
        return c == context_kind::block_key || c == context_kind::flow_key;
    }

    // Flow indicators terminate plain scalars only inside flow collections.
    inline constexpr bool is_inside_flow_collection(context_kind c) noexcept
    {
        return c == context_kind::flow_in || c == context_kind::flow_key;
    }

    inline constexpr context_kind in_flow(context_kind c) noexcept
    {
        switch (c)
        {
            case context_kind::flow_out:
            case context_kind::flow_in:
                return context_kind::flow_in;
            default:
                return context_kind::flow_key;
        }
    }

    // Block sequences nested directly under a block mapping key may sit at
    // the key's own indentation.
    inline constexpr int seq_spaces(int n, context_kind c) noexcept
    {
        return c == context_kind::block_out ? n - 1 : n;
    }

    inline std::string_view to_string(context_kind c)
    {
        switch (c)
        {
            case context_kind::block_in:  return "block-in";
            case context_kind::block_out: return "block-out";
            case context_kind::block_key: return "block-key";
            case context_kind::flow_in:   return "flow-in";
            case context_kind::flow_out:  return "flow-out";
            case context_kind::flow_key:  return "flow-key";
        }
        return "unknown";
    }

//========================================================================
// context_stack
//========================================================================

    class context_stack
    {
    public:
        struct token
        {
            size_t depth;
        };

        explicit context_stack(size_t max_depth = 512)
            : max_depth_(max_depth)
        {}

        // nullopt when the frame would exceed the configured depth.
        std::optional<token> push(context_kind kind, int indentation)
        {
            if (frames_.size() >= max_depth_)
                return std::nullopt;

            frames_.push_back({ indentation, kind });
            return token{ frames_.size() };
        }

        // Frames are released strictly in reverse order of their push.
        void pop(token t)
        {
            if (t.depth == 0 || t.depth != frames_.size())
                throw std::logic_error("context_stack: pop out of order");
            frames_.pop_back();
        }

        // Non-throwing pop for scope exits; a token that is not on top is left alone.
        void release(token t) noexcept
        {
            if (t.depth != 0 && t.depth == frames_.size())
                frames_.pop_back();
        }

        parametric_context current() const noexcept
        {
            if (frames_.empty())
                return { -1, context_kind::block_in };
            return frames_.back();
        }

        int current_indentation() const noexcept { return current().indent; }
        context_kind current_context() const noexcept { return current().kind; }
        size_t depth() const noexcept { return frames_.size(); }

    private:
        std::vector<parametric_context> frames_;
        size_t max_depth_;
    };

//------------------------------------------------------------------------
// Scoped frame: restores the caller's context on every exit path.
//------------------------------------------------------------------------

    class context_scope
    {
    public:
        context_scope(context_stack & stack, cursor const & cur, context_kind kind, int indentation)
            : stack_(stack)
        {
            auto t = stack_.push(kind, indentation);
            if (!t)
                cur.fail(scan_error_kind::depth_exceeded, "maximum nesting depth exceeded");
            token_ = *t;
        }

        ~context_scope()
        {
            stack_.release(token_);
        }

        context_scope(context_scope const &) = delete;
        context_scope & operator=(context_scope const &) = delete;

    private:
        context_stack &      stack_;
        context_stack::token token_ {0};
    };

} // namespace yml

#endif // YML_CONTEXT_HPP
