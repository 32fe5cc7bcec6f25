#include "./clean.hpp"

#include "./project.hpp"

#include <drydock/context.hpp>
#include <drydock/error/errors.hpp>
#include <drydock/error/on_error.hpp>
#include <drydock/util/fs/op.hpp>
#include <drydock/util/log.hpp>

#include <boost/leaf/exception.hpp>

#include <algorithm>
#include <system_error>

using namespace drydock;

namespace {

bool is_within(const std::filesystem::path& root, const std::filesystem::path& p) {
    auto rel = p.lexically_relative(root);
    if (rel.empty() || rel == ".") {
        return false;
    }
    return *rel.begin() != "..";
}

}  // namespace

std::vector<std::filesystem::path> drydock::clean_paths_of(const project& proj) {
    std::vector<std::filesystem::path> ret;
    auto add = [&](const std::filesystem::path& p) {
        auto full = proj.graph.resolve_path(p);
        if (!is_within(proj.root, full)) {
            BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_config>(
                                           "Refusing to clean [{}]: it is not inside the project "
                                           "directory [{}]",
                                           p.string(),
                                           proj.root.string()),
                                       e_clean_path{p});
        }
        if (std::ranges::find(ret, full) == ret.end()) {
            ret.push_back(std::move(full));
        }
    };
    std::ranges::for_each(proj.clean_paths, add);
    for (auto& t : proj.graph.targets()) {
        std::ranges::for_each(t.outputs, add);
    }
    return ret;
}

int drydock::clean_project(const pipeline_context& ctx, const project& proj) {
    int n_removed = 0;
    for (auto& p : clean_paths_of(proj)) {
        if (ctx.dry_run) {
            if (file_exists(p)) {
                drydock_log(info, "[dry-run] Would remove [{}]", p.string());
            }
            continue;
        }
        DRYDOCK_E_SCOPE(e_clean_path{p});
        try {
            if (remove_all_if_exists(p)) {
                drydock_log(debug, "Removed [{}]", p.string());
                ++n_removed;
            }
        } catch (const std::system_error& err) {
            BOOST_LEAF_THROW_EXCEPTION(make_external_error<errc::clean_failure>("{}", err.what()));
        }
    }
    drydock_log(info, "Cleaned {} path(s)", n_removed);
    return n_removed;
}
