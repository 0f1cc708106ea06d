/**
 * @file value.cpp
 * @brief Value labels, descriptions and hashing
 */

#include "reposlice/value.hpp"

#include "reposlice/common.hpp"

#include <array>
#include <format>
#include <functional>
#include <utility>

namespace reposlice::model {

namespace {

struct LabelInfo
{
    ValueLabel label;
    std::string_view name;
    std::string_view description;
};

constexpr std::array kLabelInfo = {
    LabelInfo{ValueLabel::kSrc, "SRC", "source"},
    LabelInfo{ValueLabel::kSink, "SINK", "sink"},
    LabelInfo{ValueLabel::kPara, "PARA", "parameter"},
    LabelInfo{ValueLabel::kVariPara, "VARI_PARA", "element of the variadic parameter"},
    LabelInfo{ValueLabel::kObjPara, "OBJ_PARA", "object parameter"},
    LabelInfo{ValueLabel::kArg, "ARG", "argument"},
    LabelInfo{ValueLabel::kObjArg, "OBJ_ARG", "receiver object argument"},
    LabelInfo{ValueLabel::kRet, "RET", "return value"},
    LabelInfo{ValueLabel::kOut, "OUT", "output value of the call expression"},
    LabelInfo{ValueLabel::kBufAccessExpr, "BUF_ACCESS_EXPR", "buffer access expression"},
    LabelInfo{ValueLabel::kNonBufAccessExpr, "NON_BUF_ACCESS_EXPR", "non-buffer access expression"},
    LabelInfo{ValueLabel::kConstant, "CONSTANT", "constant value"},
    LabelInfo{ValueLabel::kDeclaration, "DECLARATION", "declared variable"},
    LabelInfo{ValueLabel::kLocal, "LOCAL", "local variable"},
    LabelInfo{ValueLabel::kGlobal, "GLOBAL", "global variable"},
};

[[nodiscard]] const LabelInfo& label_info(ValueLabel label)
{
    return kLabelInfo.at(static_cast<std::size_t>(label));
}

[[nodiscard]] std::string ordinal(int n)
{
    const int mod100 = n % 100;
    std::string_view suffix = "th";
    if (mod100 < 11 || mod100 > 13) {
        switch (n % 10) {
            case 1:
                suffix = "st";
                break;
            case 2:
                suffix = "nd";
                break;
            case 3:
                suffix = "rd";
                break;
            default:
                break;
        }
    }
    return std::format("{}{}", n, suffix);
}

using common::hash_combine;

}  // namespace

std::string_view to_string(ValueLabel label)
{
    return label_info(label).name;
}

bool is_parameter(ValueLabel label)
{
    return label == ValueLabel::kPara || label == ValueLabel::kVariPara
           || label == ValueLabel::kObjPara;
}

bool is_argument(ValueLabel label)
{
    return label == ValueLabel::kArg || label == ValueLabel::kObjArg;
}

Value::Value(ValueInit init)
    : m_name(std::move(init.name))
    , m_label(init.label)
    , m_file_path(std::move(init.file_path))
    , m_line_in_file(init.line_in_file)
    , m_function_id(init.function_id)
    , m_function_name(std::move(init.function_name))
    , m_line_in_function(init.line_in_function)
    , m_index(init.index)
    , m_comment(std::move(init.comment))
{}

std::string Value::description() const
{
    const auto type_desc = label_info(m_label).description;
    std::string desc;
    if (m_index != -1) {
        desc = std::format("{} {} `{}` (at index {})", ordinal(m_index + 1), type_desc, m_name, m_index);
    } else {
        desc = std::format("the {} `{}`", type_desc, m_name);
    }
    if (!m_function_name.empty() && m_line_in_function != -1) {
        desc += std::format(" at line {} of this function `{}`", m_line_in_function, m_function_name);
    }
    if (m_comment) {
        desc += std::format(" (comment: {})", *m_comment);
    }
    return desc;
}

std::size_t ValueHash::operator()(const Value& value) const noexcept
{
    std::size_t seed = std::hash<std::string>{}(value.name());
    hash_combine(seed, static_cast<std::size_t>(value.label()));
    hash_combine(seed, std::hash<std::string>{}(value.file_path()));
    hash_combine(seed, std::hash<int>{}(value.line_in_file()));
    hash_combine(seed, std::hash<int>{}(value.function_id()));
    hash_combine(seed, std::hash<std::string>{}(value.function_name()));
    hash_combine(seed, std::hash<int>{}(value.line_in_function()));
    hash_combine(seed, std::hash<int>{}(value.index()));
    if (value.comment()) {
        hash_combine(seed, std::hash<std::string>{}(*value.comment()));
    }
    return seed;
}

void to_json(nlohmann::json& j, const Value& value)
{
    j = nlohmann::json{
        {"name", value.name()},
        {"label", std::string(to_string(value.label()))},
        {"file_path", value.file_path()},
        {"line_in_file", value.line_in_file()},
        {"function_id", value.function_id()},
        {"function_name", value.function_name()},
        {"line_in_function", value.line_in_function()},
        {"index", value.index()},
    };
    if (value.comment()) {
        j["comment"] = *value.comment();
    }
}

}  // namespace reposlice::model
