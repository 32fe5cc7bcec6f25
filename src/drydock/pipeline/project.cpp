#include "./project.hpp"

#include <drydock/error/errors.hpp>
#include <drydock/error/on_error.hpp>
#include <drydock/util/duration.hpp>
#include <drydock/util/dym.hpp>
#include <drydock/util/fs/op.hpp>
#include <drydock/util/log.hpp>
#include <drydock/util/string.hpp>
#include <drydock/util/yaml/parse.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/format.h>
#include <yaml-cpp/node/convert.h>
#include <yaml-cpp/node/iterator.h>

#include <algorithm>
#include <initializer_list>
#include <ranges>

using namespace drydock;

namespace {

using keys_t = std::initializer_list<std::string_view>;

std::string join_key(std::string_view parent, std::string_view key) {
    if (parent.empty()) {
        return std::string(key);
    }
    return fmt::format("{}.{}", parent, key);
}

[[noreturn]] void fail_at(const YAML::Node& node, std::string_view where, std::string message) {
    if (where.empty()) {
        where = "<top-level>";
    }
    auto line = node.Mark().line;
    if (line >= 0) {
        message = fmt::format("{} (`{}`, line {})", message, where, line + 1);
    } else {
        message = fmt::format("{} (`{}`)", message, where);
    }
    BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_config>("{}", message),
                               e_manifest_key{std::string(where)});
}

void expect_map(const YAML::Node& node, std::string_view where) {
    if (node && !node.IsMap() && !node.IsNull()) {
        fail_at(node, where, "Expected a mapping");
    }
}

/// Reject any key of `map` that is not one of `allowed`
void check_keys(const YAML::Node& map, std::string_view where, keys_t allowed) {
    expect_map(map, where);
    for (auto&& kv : map) {
        if (!kv.first.IsScalar()) {
            fail_at(kv.first, where, "Mapping keys must be strings");
        }
        auto& key = kv.first.Scalar();
        if (std::ranges::find(allowed, std::string_view(key)) != allowed.end()) {
            continue;
        }
        auto nearest = did_you_mean(key, allowed);
        auto message = where.empty()
            ? fmt::format("Unknown top-level key `{}`", key)
            : fmt::format("Unknown key `{}` in `{}`", key, where);
        if (nearest) {
            message += fmt::format(" (Did you mean `{}`?)", *nearest);
        }
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_config>("{}", message),
                                   e_bad_manifest_key{key, nearest},
                                   e_manifest_key{join_key(where, key)});
    }
}

std::string as_string(const YAML::Node& node, std::string_view where) {
    if (!node.IsScalar()) {
        fail_at(node, where, "Expected a string");
    }
    return node.Scalar();
}

/// A single string, or a sequence of strings
std::vector<std::string> as_string_list(const YAML::Node& node, std::string_view where) {
    std::vector<std::string> ret;
    if (!node || node.IsNull()) {
        return ret;
    } else if (node.IsScalar()) {
        ret.push_back(node.Scalar());
        return ret;
    } else if (!node.IsSequence()) {
        fail_at(node, where, "Expected a string or a list of strings");
    }
    for (auto&& item : node) {
        ret.push_back(as_string(item, where));
    }
    return ret;
}

std::vector<std::filesystem::path> as_path_list(const YAML::Node& node, std::string_view where) {
    auto strs = as_string_list(node, where);
    return std::vector<std::filesystem::path>(strs.begin(), strs.end());
}

env_map as_env(const YAML::Node& node, std::string_view where) {
    expect_map(node, where);
    env_map ret;
    if (!node) {
        return ret;
    }
    for (auto&& kv : node) {
        auto key = as_string(kv.first, where);
        ret.insert_or_assign(key, as_string(kv.second, join_key(where, key)));
    }
    return ret;
}

bool as_bool(const YAML::Node& node, std::string_view where) {
    bool b = false;
    if (!node.IsScalar() || !YAML::convert<bool>::decode(node, b)) {
        fail_at(node, where, "Expected `true` or `false`");
    }
    return b;
}

int as_positive_int(const YAML::Node& node, std::string_view where) {
    int n = 0;
    if (!node.IsScalar() || !YAML::convert<int>::decode(node, n) || n < 1) {
        fail_at(node, where, "Expected a positive integer");
    }
    return n;
}

std::chrono::milliseconds as_duration(const YAML::Node& node, std::string_view where) {
    DRYDOCK_E_SCOPE(e_manifest_key{std::string(where)});
    return parse_duration(as_string(node, where));
}

/**
 * @brief Call `fn(name, node, key-path)` for each entry of a name-keyed section
 */
template <typename Func>
void for_each_entry(const YAML::Node& section, std::string_view where, Func&& fn) {
    expect_map(section, where);
    if (!section) {
        return;
    }
    for (auto&& kv : section) {
        auto name = as_string(kv.first, where);
        if (trim_view(name).empty()) {
            fail_at(kv.first, where, "Names must not be empty");
        }
        fn(name, kv.second, join_key(where, name));
    }
}

target parse_target(std::string name, const YAML::Node& node, std::string_view where) {
    check_keys(node, where, {"inputs", "deps", "outputs", "run", "cwd", "env", "always-run"});
    target ret;
    ret.name = std::move(name);
    if (node.IsNull()) {
        return ret;
    }
    ret.inputs   = as_path_list(node["inputs"], join_key(where, "inputs"));
    ret.deps     = as_string_list(node["deps"], join_key(where, "deps"));
    ret.outputs  = as_path_list(node["outputs"], join_key(where, "outputs"));
    ret.commands = as_string_list(node["run"], join_key(where, "run"));
    if (auto cwd = node["cwd"]) {
        ret.cwd = as_string(cwd, join_key(where, "cwd"));
    }
    ret.env = as_env(node["env"], join_key(where, "env"));
    if (auto ar = node["always-run"]) {
        ret.always_stale = as_bool(ar, join_key(where, "always-run"));
    }
    return ret;
}

readiness_probe parse_readiness(const YAML::Node& node, std::string_view where) {
    readiness_probe ret;
    if (node.IsScalar()) {
        ret.command = node.Scalar();
        return ret;
    }
    check_keys(node, where, {"check", "interval", "timeout", "attempts", "attempt-timeout"});
    if (auto check = node["check"]) {
        ret.command = as_string(check, join_key(where, "check"));
    }
    if (auto iv = node["interval"]) {
        ret.interval = as_duration(iv, join_key(where, "interval"));
    }
    if (auto budget = node["timeout"]) {
        ret.budget = as_duration(budget, join_key(where, "timeout"));
    }
    if (auto att = node["attempts"]) {
        ret.max_attempts = as_positive_int(att, join_key(where, "attempts"));
    }
    if (auto at = node["attempt-timeout"]) {
        ret.attempt_timeout = as_duration(at, join_key(where, "attempt-timeout"));
    }
    return ret;
}

service_spec parse_service(std::string name, const YAML::Node& node, std::string_view where) {
    check_keys(node,
               where,
               {"start",
                "stop",
                "image",
                "ports",
                "run-args",
                "command",
                "ready",
                "env",
                "cwd",
                "background",
                "cleanup"});
    service_spec ret;
    ret.name = std::move(name);

    if (auto start = node["start"]) {
        ret.start = as_string(start, join_key(where, "start"));
    }
    if (auto stop = node["stop"]) {
        ret.stop = as_string(stop, join_key(where, "stop"));
    }
    if (auto image = node["image"]) {
        ret.image = container_image{
            .image    = as_string(image, join_key(where, "image")),
            .ports    = as_string_list(node["ports"], join_key(where, "ports")),
            .run_args = as_string_list(node["run-args"], join_key(where, "run-args")),
            .command  = as_string_list(node["command"], join_key(where, "command")),
        };
    } else {
        for (auto key : {"ports", "run-args", "command"}) {
            if (node[key]) {
                fail_at(node[key],
                        join_key(where, key),
                        fmt::format("`{}` is only meaningful for services with an `image`", key));
            }
        }
    }

    if (ret.start.has_value() == ret.image.has_value()) {
        fail_at(node, where, "A service needs exactly one of `start` or `image`");
    }

    if (auto ready = node["ready"]) {
        ret.ready = parse_readiness(ready, join_key(where, "ready"));
    }
    ret.env = as_env(node["env"], join_key(where, "env"));
    if (auto cwd = node["cwd"]) {
        ret.cwd = as_string(cwd, join_key(where, "cwd"));
    }
    if (auto bg = node["background"]) {
        ret.background = as_bool(bg, join_key(where, "background"));
        if (ret.background && ret.image) {
            fail_at(bg,
                    join_key(where, "background"),
                    "Image services cannot run in the background");
        }
    }
    if (auto cleanup = node["cleanup"]) {
        ret.cleanup_before_start = as_bool(cleanup, join_key(where, "cleanup"));
    }
    return ret;
}

test_suite parse_suite(std::string name, const YAML::Node& node, std::string_view where) {
    check_keys(node, where, {"run", "setup", "env", "services", "require-env", "timeout", "cwd"});
    test_suite ret;
    ret.name     = std::move(name);
    ret.commands = as_string_list(node["run"], join_key(where, "run"));
    if (ret.commands.empty()) {
        fail_at(node, where, "A test suite needs at least one `run` command");
    }
    ret.setup        = as_string_list(node["setup"], join_key(where, "setup"));
    ret.env          = as_env(node["env"], join_key(where, "env"));
    ret.services     = as_string_list(node["services"], join_key(where, "services"));
    ret.required_env = as_string_list(node["require-env"], join_key(where, "require-env"));
    if (auto tm = node["timeout"]) {
        ret.timeout = as_duration(tm, join_key(where, "timeout"));
    }
    if (auto cwd = node["cwd"]) {
        ret.cwd = as_string(cwd, join_key(where, "cwd"));
    }
    return ret;
}

pipeline_stage parse_stage(const YAML::Node& node, std::string_view where) {
    if (node.IsScalar()) {
        if (node.Scalar() == "clean") {
            return clean_stage{};
        } else if (node.Scalar() == "build") {
            return build_stage{};
        }
        auto nearest = did_you_mean(node.Scalar(), {"clean", "build", "test"});
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_config>(
                                       "Unknown pipeline stage `{}` in `{}`", node.Scalar(), where),
                                   e_bad_manifest_key{node.Scalar(), nearest},
                                   e_manifest_key{std::string(where)});
    }
    check_keys(node, where, {"clean", "build", "test"});
    if (node.size() != 1) {
        fail_at(node,
                where,
                "Each pipeline stage must have exactly one of `clean`, `build`, or `test`");
    }
    auto kv   = *node.begin();
    auto kind = kv.first.Scalar();
    if (kind == "clean") {
        return clean_stage{};
    } else if (kind == "build") {
        return build_stage{.targets = as_string_list(kv.second, join_key(where, "build"))};
    } else {
        return test_stage{.suite = as_string(kv.second, join_key(where, "test"))};
    }
}

pipeline_def parse_pipeline(std::string name, const YAML::Node& node, std::string_view where) {
    pipeline_def ret;
    ret.name = std::move(name);
    // A pipeline may be given as just its list of stages
    if (!node.IsSequence()) {
        check_keys(node, where, {"stages", "timeout"});
        if (auto tm = node["timeout"]) {
            ret.timeout = as_duration(tm, join_key(where, "timeout"));
        }
    }
    auto stages = node.IsSequence() ? node : node["stages"];
    auto stages_key = join_key(where, "stages");
    if (!stages || !stages.IsSequence() || stages.size() == 0) {
        fail_at(node, stages_key, "A pipeline needs a non-empty list of stages");
    }
    int idx = 0;
    for (auto&& st : stages) {
        ret.stages.push_back(parse_stage(st, fmt::format("{}[{}]", stages_key, idx++)));
    }
    return ret;
}

std::string describe(const clean_stage&) { return "clean"; }
std::string describe(const build_stage& b) {
    if (b.targets.empty()) {
        return "build: <all>";
    }
    return "build: " + joinstr(", ", b.targets);
}
std::string describe(const test_stage& t) { return "test: " + t.suite; }

template <typename Range>
auto names_of(const Range& items) {
    return items | std::views::transform([](auto& item) -> std::string_view { return item.name; });
}

}  // namespace

std::string drydock::describe_stage(const pipeline_stage& st) {
    return std::visit([](auto& s) { return describe(s); }, st);
}

project project::open_directory(path_ref dirpath) {
    DRYDOCK_E_SCOPE(e_open_project{dirpath});
    auto manifest = dirpath / "drydock.yaml";
    if (!file_exists(manifest)) {
        if (file_exists(dirpath / "drydock.yml")) {
            drydock_log(warn,
                        "There's a [drydock.yml] file in the project directory, but drydock "
                        "expects a '.yaml' file extension. The file [{}] will be ignored.",
                        (dirpath / "drydock.yml").string());
        }
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_config>(
                                       "No drydock.yaml was found in [{}]",
                                       dirpath.string()),
                                   e_manifest_path{manifest});
    }
    return from_file(manifest);
}

project project::from_file(path_ref manifest) {
    DRYDOCK_E_SCOPE(e_manifest_path{manifest});
    auto root = std::filesystem::absolute(manifest).lexically_normal().parent_path();
    auto data = parse_yaml_file(manifest);
    return from_yaml(data, std::move(root));
}

project project::from_yaml(const YAML::Node& data, std::filesystem::path root) {
    check_keys(data, "", {"env", "clean", "targets", "services", "suites", "pipelines"});

    project ret{std::move(root)};
    if (data.IsNull()) {
        return ret;
    }

    ret.env         = as_env(data["env"], "env");
    ret.clean_paths = as_path_list(data["clean"], "clean");

    for_each_entry(data["targets"], "targets", [&](auto name, auto& node, auto where) {
        DRYDOCK_E_SCOPE(e_manifest_key{where});
        ret.graph.add(parse_target(name, node, where));
    });

    for_each_entry(data["services"], "services", [&](auto name, auto& node, auto where) {
        if (ret.find_service(name)) {
            fail_at(node, where, fmt::format("Service `{}` is declared more than once", name));
        }
        ret.services.push_back(parse_service(name, node, where));
    });

    for_each_entry(data["suites"], "suites", [&](auto name, auto& node, auto where) {
        if (ret.find_suite(name)) {
            fail_at(node, where, fmt::format("Suite `{}` is declared more than once", name));
        }
        auto suite = parse_suite(name, node, where);
        DRYDOCK_E_SCOPE(e_manifest_key{join_key(where, "services")});
        for (auto& svc : suite.services) {
            ret.get_service(svc);
        }
        ret.suites.push_back(std::move(suite));
    });

    for_each_entry(data["pipelines"], "pipelines", [&](auto name, auto& node, auto where) {
        if (ret.find_pipeline(name)) {
            fail_at(node, where, fmt::format("Pipeline `{}` is declared more than once", name));
        }
        auto pl = parse_pipeline(name, node, where);
        DRYDOCK_E_SCOPE(e_manifest_key{where});
        for (auto& st : pl.stages) {
            if (auto build = std::get_if<build_stage>(&st)) {
                for (auto& tn : build->targets) {
                    ret.graph.get(tn);
                }
            } else if (auto test = std::get_if<test_stage>(&st)) {
                ret.get_suite(test->suite);
            }
        }
        ret.pipelines.push_back(std::move(pl));
    });

    {
        DRYDOCK_E_SCOPE(e_manifest_key{"targets"});
        ret.graph.validate();
    }
    return ret;
}

const service_spec* project::find_service(std::string_view name) const noexcept {
    auto it = std::ranges::find(services, name, &service_spec::name);
    return it == services.end() ? nullptr : &*it;
}

const test_suite* project::find_suite(std::string_view name) const noexcept {
    auto it = std::ranges::find(suites, name, &test_suite::name);
    return it == suites.end() ? nullptr : &*it;
}

const pipeline_def* project::find_pipeline(std::string_view name) const noexcept {
    auto it = std::ranges::find(pipelines, name, &pipeline_def::name);
    return it == pipelines.end() ? nullptr : &*it;
}

const service_spec& project::get_service(std::string_view name) const {
    if (auto svc = find_service(name)) {
        return *svc;
    }
    BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::unknown_service>("No service named '{}'",
                                                                      name),
                               e_nonesuch{name, did_you_mean(name, names_of(services))});
}

const test_suite& project::get_suite(std::string_view name) const {
    if (auto suite = find_suite(name)) {
        return *suite;
    }
    BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::unknown_suite>("No test suite named '{}'",
                                                                    name),
                               e_nonesuch{name, did_you_mean(name, names_of(suites))});
}

const pipeline_def& project::get_pipeline(std::string_view name) const {
    if (auto pl = find_pipeline(name)) {
        return *pl;
    }
    BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::unknown_pipeline>("No pipeline named '{}'",
                                                                       name),
                               e_nonesuch{name, did_you_mean(name, names_of(pipelines))});
}
