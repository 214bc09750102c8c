#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sandbox {

/**
 * @brief 支持的语言，是一个封闭的集合
 * 请求中的语言字符串在系统边界通过 parse_language 校验，
 * 沙盒内部只使用枚举值，不再按字符串查找。
 */
enum class language {
    PYTHON,
    CPP,
    C,
    GO,
    JAVA,
    NODEJS,
    TYPESCRIPT,
    BASH,
    RUST,
    LUA
};

/**
 * @brief 语言在请求和配置文件中使用的名字，比如 "python"、"cpp"
 */
const char *get_language_name(language lang);

/**
 * @brief 根据名字查找语言
 * @return 名字无法识别时为空
 */
std::optional<language> parse_language(const std::string &name);

std::vector<language> all_languages();

}  // namespace sandbox
