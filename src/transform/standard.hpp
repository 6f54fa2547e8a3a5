#ifndef DOCPRESS_TRANSFORM_STANDARD_HPP
#define DOCPRESS_TRANSFORM_STANDARD_HPP

#include <string>
#include <string_view>
#include <vector>

#include "transform/transform.hpp"

namespace docpress {

/// @brief Converts text into a form usable as an id.
/// ASCII letters and digits are kept in lower case, and every other run of characters becomes a
/// single `-`, with leading and trailing hyphens removed.
/// If nothing remains, the result is `"section"`.
[[nodiscard]] std::string make_id_slug(std::string_view text);

/// @brief Assigns every section an id derived from its title, when `section-ids` is enabled.
struct Section_Ids_Transform final : Transform {
    static constexpr int default_priority = 260;

    Section_Ids_Transform(Node_Id target, Order_Counter& counter)
        : Transform(default_priority, target, counter)
    {
    }

    [[nodiscard]] std::string_view name() const final
    {
        return "section-ids";
    }

    [[nodiscard]] Result<void, Condition> apply(Transform_Context& context) final;
};

/// @brief When `doctitle` is enabled and the document consists of a single top-level section
/// (ignoring comments), turns the title of that section into the document title and hoists the
/// rest of its contents into the document.
struct Doc_Title_Transform final : Transform {
    static constexpr int default_priority = 320;

    Doc_Title_Transform(Node_Id target, Order_Counter& counter)
        : Transform(default_priority, target, counter)
    {
    }

    [[nodiscard]] std::string_view name() const final
    {
        return "doctitle";
    }

    [[nodiscard]] Result<void, Condition> apply(Transform_Context& context) final;
};

/// @brief Stores the `title` setting as the `title` attribute of the document, if set.
struct Title_Override_Transform final : Transform {
    static constexpr int default_priority = 340;

    Title_Override_Transform(Node_Id target, Order_Counter& counter)
        : Transform(default_priority, target, counter)
    {
    }

    [[nodiscard]] std::string_view name() const final
    {
        return "title-override";
    }

    [[nodiscard]] Result<void, Condition> apply(Transform_Context& context) final;
};

/// @brief Removes all comments when `strip-comments` is enabled.
struct Strip_Comments_Transform final : Transform {
    static constexpr int default_priority = 740;

    Strip_Comments_Transform(Node_Id target, Order_Counter& counter)
        : Transform(default_priority, target, counter)
    {
    }

    [[nodiscard]] std::string_view name() const final
    {
        return "strip-comments";
    }

    [[nodiscard]] Result<void, Condition> apply(Transform_Context& context) final;
};

/// @brief Raises a warning for the first section which contains nothing but its title.
struct Empty_Sections_Transform final : Transform {
    static constexpr int default_priority = 840;

    Empty_Sections_Transform(Node_Id target, Order_Counter& counter)
        : Transform(default_priority, target, counter)
    {
    }

    [[nodiscard]] std::string_view name() const final
    {
        return "empty-sections";
    }

    [[nodiscard]] Result<void, Condition> apply(Transform_Context& context) final;
};

extern const Transform_Type section_ids_transform;
extern const Transform_Type doc_title_transform;
extern const Transform_Type title_override_transform;
extern const Transform_Type strip_comments_transform;
extern const Transform_Type empty_sections_transform;

/// @brief Returns the transforms which readers apply by default.
[[nodiscard]] std::vector<const Transform_Type*> standard_transforms();

} // namespace docpress

#endif
