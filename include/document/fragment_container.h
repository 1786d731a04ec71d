#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docsan {
namespace document {

/**
 * @brief A unit of logical text stored as ordered, styled fragments
 *
 * The visible text of the container is the concatenation of its fragments.
 * Rewriting a fragment changes only its text payload; whatever styling the
 * implementation attaches to the fragment stays untouched.
 */
class IFragmentContainer {
public:
    virtual ~IFragmentContainer() = default;

    virtual size_t fragmentCount() const = 0;
    virtual const std::string& fragmentText(size_t index) const = 0;
    virtual void setFragmentText(size_t index, std::string text) = 0;

    /**
     * @brief Everything a reader sees, including text the fragment API
     *        does not expose (e.g. runs nested inside wrappers)
     */
    virtual std::string visibleText() const = 0;

    /**
     * @brief Every text-bearing node, exposed or not
     *
     * Used only by the degraded rewrite path.
     */
    virtual std::vector<std::string*> textNodes() = 0;
};

} // namespace document
} // namespace docsan
