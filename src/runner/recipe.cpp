#include "runner/recipe.hpp"
#include <glog/logging.h>
#include <stdexcept>

namespace sandbox {
using namespace std;

recipe::~recipe() = default;

template_recipe::template_recipe(language_template tpl, recipe_environment env)
    : tpl(move(tpl)), env(move(env)) {}

code_run_result template_recipe::run(const code_run_args &args) const {
    workspace ws(env.workspace_root);
    ws.materialize(args.files);
    ws.write(tpl.source, args.code);

    code_run_result result;
    execute(ws, args, result);
    result.files = ws.fetch(args.fetch_files);
    return result;
}

command_run_result template_recipe::run_step(const workspace &ws, const string &command_template,
                                             chrono::duration<double> timeout,
                                             const optional<uint64_t> &memory_limit,
                                             const optional<string> &stdin_data) const {
    process::command_options options;
    options.command = expand_command(command_template, tpl.source, ws.path(), env.script_dir);
    options.workdir = ws.path();
    options.timeout = timeout;
    options.memory_limit = memory_limit;
    options.stdin_data = stdin_data;
    return process::run_command(options, *env.reaper);
}

void interpreted_recipe::execute(const workspace &ws, const code_run_args &args, code_run_result &result) const {
    result.run_result = run_step(ws, tpl.run, args.run_timeout, args.memory_limit, args.stdin_data);
}

void compiled_recipe::execute(const workspace &ws, const code_run_args &args, code_run_result &result) const {
    result.compile_result = run_step(ws, tpl.compile.value(), args.compile_timeout, args.memory_limit, nullopt);
    auto &compile = *result.compile_result;
    if (compile.status != command_run_status::FINISHED || compile.return_code != 0) {
        VLOG(1) << "Compilation failed, skipping run step";
        return;
    }
    result.run_result = run_step(ws, tpl.run, args.run_timeout, args.memory_limit, args.stdin_data);
}

unique_ptr<recipe> make_recipe(const language_template &tpl, const recipe_environment &env) {
    if (tpl.compile) return make_unique<compiled_recipe>(tpl, env);
    else return make_unique<interpreted_recipe>(tpl, env);
}

void recipe_registry::add(language lang, unique_ptr<recipe> r) {
    recipes[lang] = move(r);
}

bool recipe_registry::contains(language lang) const {
    return recipes.count(lang);
}

const recipe &recipe_registry::get(language lang) const {
    auto it = recipes.find(lang);
    if (it == recipes.end())
        throw invalid_argument(string("no recipe registered for language ") + get_language_name(lang));
    return *it->second;
}

code_run_result recipe_registry::dispatch(const code_run_args &args) const {
    return get(args.lang).run(args);
}

recipe_registry recipe_registry::from_config(const language_config &config, const recipe_environment &env) {
    recipe_registry registry;
    for (auto &[lang, tpl] : config.templates)
        registry.add(lang, make_recipe(tpl, env));
    return registry;
}

}  // namespace sandbox
