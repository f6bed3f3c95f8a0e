#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <vector>

#include <sparrow/c_interface.hpp>

namespace cdata_bridge
{
    /**
     * Releases an `ArrowArray` or `ArrowSchema` unless it has already been
     * released or moved out. Does nothing on a null pointer.
     */
    template <class T>
        requires std::same_as<T, ArrowArray> || std::same_as<T, ArrowSchema>
    void release_if_alive(T* t)
    {
        if (t != nullptr && t->release != nullptr)
        {
            t->release(t);
        }
    }

    /**
     * Storage for the children and the dictionary of an exported `ArrowArray` or
     * `ArrowSchema`, owned by the private data of the parent.
     *
     * The child structures live in a contiguous arena that is sized once, so the
     * pointers handed to the C structure stay valid. On destruction, every child
     * and the dictionary are released unless a consumer moved them out (which
     * leaves their release callback null).
     *
     * @tparam T `ArrowArray` or `ArrowSchema`
     */
    template <class T>
        requires std::same_as<T, ArrowArray> || std::same_as<T, ArrowSchema>
    class children_arena
    {
    public:

        children_arena(std::size_t n_children, bool has_dictionary)
            : m_children(n_children, T{})
            , m_dictionary(has_dictionary ? std::make_unique<T>() : nullptr)
        {
            m_children_pointers.reserve(n_children);
            for (auto& child : m_children)
            {
                m_children_pointers.push_back(&child);
            }
        }

        ~children_arena()
        {
            for (auto& child : m_children)
            {
                release_if_alive(&child);
            }
            release_if_alive(m_dictionary.get());
        }

        children_arena(const children_arena&) = delete;
        children_arena& operator=(const children_arena&) = delete;
        children_arena(children_arena&&) = delete;
        children_arena& operator=(children_arena&&) = delete;

        [[nodiscard]] std::size_t size() const noexcept
        {
            return m_children.size();
        }

        [[nodiscard]] T& child(std::size_t i)
        {
            return m_children.at(i);
        }

        // Null when there are no children.
        [[nodiscard]] T** children_ptrs() noexcept
        {
            return m_children_pointers.empty() ? nullptr : m_children_pointers.data();
        }

        [[nodiscard]] T* dictionary() noexcept
        {
            return m_dictionary.get();
        }

    private:

        std::vector<T> m_children;
        std::vector<T*> m_children_pointers;
        std::unique_ptr<T> m_dictionary;
    };
}
