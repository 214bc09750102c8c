#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include "process/executor.hpp"
#include "runner/language_config.hpp"
#include "runner/types.hpp"
#include "runner/workspace.hpp"

namespace sandbox {

/**
 * @brief 运行用户代码所需的环境
 */
struct recipe_environment {
    /**
     * @brief 请求工作目录的父目录
     */
    std::filesystem::path workspace_root;

    /**
     * @brief 辅助脚本所在的目录，用于展开 {script_dir}
     */
    std::filesystem::path script_dir;

    process::process_tree_reaper *reaper = &process::default_reaper();
};

/**
 * @brief 一种语言的执行流程
 */
struct recipe {
    virtual ~recipe();

    /**
     * @brief 在一个新的工作目录中编译运行用户代码
     * 编译或运行失败保存在结果中，不会抛出异常。
     * 无论是否抛出异常，工作目录都会被删除。
     * @throw sandbox_exception 等沙盒内部错误，比如请求中的文件路径不安全
     */
    virtual code_run_result run(const code_run_args &args) const = 0;
};

/**
 * @brief 基于命令模板的执行流程
 * 1. 创建工作目录，写入请求附带的文件和用户代码；
 * 2. 执行 execute（编译和/或运行）；
 * 3. 读回 fetch_files 中存在的文件；
 * 4. 删除工作目录。
 */
struct template_recipe : public recipe {
    template_recipe(language_template tpl, recipe_environment env);

    code_run_result run(const code_run_args &args) const override;

protected:
    virtual void execute(const workspace &ws, const code_run_args &args, code_run_result &result) const = 0;

    /**
     * @brief 在工作目录中执行一条命令模板
     */
    command_run_result run_step(const workspace &ws, const std::string &command_template,
                                std::chrono::duration<double> timeout,
                                const std::optional<uint64_t> &memory_limit,
                                const std::optional<std::string> &stdin_data) const;

    language_template tpl;
    recipe_environment env;
};

/**
 * @brief 解释型语言，只有运行步骤
 */
struct interpreted_recipe : public template_recipe {
    using template_recipe::template_recipe;

protected:
    void execute(const workspace &ws, const code_run_args &args, code_run_result &result) const override;
};

/**
 * @brief 编译型语言，编译成功（正常结束且返回 0）之后才会运行
 * 编译步骤没有 stdin，使用 compile_timeout。
 */
struct compiled_recipe : public template_recipe {
    using template_recipe::template_recipe;

protected:
    void execute(const workspace &ws, const code_run_args &args, code_run_result &result) const override;
};

/**
 * @brief 根据命令模板创建执行流程，有编译命令的为编译型
 */
std::unique_ptr<recipe> make_recipe(const language_template &tpl, const recipe_environment &env);

/**
 * @brief 语言到执行流程的注册表
 */
struct recipe_registry {
    recipe_registry() = default;
    recipe_registry(const recipe_registry &) = delete;
    recipe_registry(recipe_registry &&) = default;

    recipe_registry &operator=(const recipe_registry &) = delete;
    recipe_registry &operator=(recipe_registry &&) = default;

    void add(language lang, std::unique_ptr<recipe> r);

    bool contains(language lang) const;

    /**
     * @throw std::invalid_argument 该语言没有注册
     */
    const recipe &get(language lang) const;

    /**
     * @brief 查找语言对应的执行流程并运行
     * @throw std::invalid_argument 该语言没有注册
     */
    code_run_result dispatch(const code_run_args &args) const;

    static recipe_registry from_config(const language_config &config, const recipe_environment &env);

private:
    std::map<language, std::unique_ptr<recipe>> recipes;
};

}  // namespace sandbox
