#pragma once

/**
 * @file value.hpp
 * @brief Program values tracked by the slicer
 *
 * A Value is one program entity (parameter, argument, return expression, ...)
 * with a role label. Values are immutable and compare structurally, so they
 * can be used directly as set and map keys.
 */

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include <nlohmann/json.hpp>

namespace reposlice::model {

using FunctionId = int;

enum class ValueLabel {
    kSrc,
    kSink,
    kPara,
    kVariPara,
    kObjPara,
    kArg,
    kObjArg,
    kRet,
    kOut,
    kBufAccessExpr,
    kNonBufAccessExpr,
    kConstant,
    kDeclaration,
    kLocal,
    kGlobal,
};

[[nodiscard]] std::string_view to_string(ValueLabel label);
[[nodiscard]] bool is_parameter(ValueLabel label);
[[nodiscard]] bool is_argument(ValueLabel label);

struct ValueInit
{
    std::string name;
    ValueLabel label = ValueLabel::kLocal;
    std::string file_path;
    int line_in_file = -1;
    FunctionId function_id = -1;
    std::string function_name;
    int line_in_function = -1;
    int index = -1;
    std::optional<std::string> comment;
};

class Value
{
public:
    explicit Value(ValueInit init);

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ValueLabel label() const { return m_label; }
    [[nodiscard]] const std::string& file_path() const { return m_file_path; }
    [[nodiscard]] int line_in_file() const { return m_line_in_file; }
    [[nodiscard]] FunctionId function_id() const { return m_function_id; }
    [[nodiscard]] const std::string& function_name() const { return m_function_name; }
    [[nodiscard]] int line_in_function() const { return m_line_in_function; }
    [[nodiscard]] int index() const { return m_index; }
    [[nodiscard]] const std::optional<std::string>& comment() const { return m_comment; }

    /// Identifying tuple; equality, ordering and hashing all go through it.
    [[nodiscard]] auto key() const
    {
        return std::tie(m_name,
                        m_label,
                        m_file_path,
                        m_line_in_file,
                        m_function_id,
                        m_function_name,
                        m_line_in_function,
                        m_index,
                        m_comment);
    }

    /**
     * Human-readable description used in oracle prompts, e.g.
     * "1st parameter `x` (at index 0) at line 2 of this function `foo`".
     */
    [[nodiscard]] std::string description() const;

    friend bool operator==(const Value& lhs, const Value& rhs) { return lhs.key() == rhs.key(); }
    friend std::strong_ordering operator<=>(const Value& lhs, const Value& rhs)
    {
        return lhs.key() <=> rhs.key();
    }

private:
    std::string m_name;
    ValueLabel m_label;
    std::string m_file_path;
    int m_line_in_file;
    FunctionId m_function_id;
    std::string m_function_name;
    int m_line_in_function;
    int m_index;
    std::optional<std::string> m_comment;
};

struct ValueHash
{
    [[nodiscard]] std::size_t operator()(const Value& value) const noexcept;
};

void to_json(nlohmann::json& j, const Value& value);

}  // namespace reposlice::model
