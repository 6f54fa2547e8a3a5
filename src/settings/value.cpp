#include <string>

#include "common/assert.hpp"

#include "settings/value.hpp"

namespace docpress {

namespace {

struct Element_Printer {
    std::string operator()(bool b) const
    {
        return b ? "true" : "false";
    }

    std::string operator()(Int x) const
    {
        return std::to_string(x);
    }

    std::string operator()(const std::string& s) const
    {
        return s;
    }

    std::string operator()(const std::filesystem::path& p) const
    {
        return p.generic_string();
    }

    std::string operator()(const Symbol& s) const
    {
        return s.name;
    }
};

} // namespace

std::string to_string(const Setting_Element& element)
{
    return std::visit(Element_Printer {}, element);
}

std::string to_string(const Setting_Value& value)
{
    switch (value.index()) {
    case 0: return {};
    case 1: return Element_Printer {}(std::get<bool>(value));
    case 2: return Element_Printer {}(std::get<Int>(value));
    case 3: return std::get<std::string>(value);
    case 4: return Element_Printer {}(std::get<std::filesystem::path>(value));
    case 5: return std::get<Symbol>(value).name;
    case 6: {
        std::string result;
        for (const Setting_Element& e : std::get<Setting_List>(value)) {
            if (!result.empty()) {
                result += ", ";
            }
            result += to_string(e);
        }
        return result;
    }
    }
    DOCPRESS_ASSERT_UNREACHABLE("invalid setting value");
}

} // namespace docpress
