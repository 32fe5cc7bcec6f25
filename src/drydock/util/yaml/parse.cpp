#include "./parse.hpp"

#include <drydock/error/errors.hpp>
#include <drydock/error/on_error.hpp>
#include <drydock/util/fs/io.hpp>

#include <boost/leaf/exception.hpp>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/node/parse.h>

#include <string>

using namespace drydock;

YAML::Node drydock::parse_yaml_file(const std::filesystem::path& fpath) {
    DRYDOCK_E_SCOPE(e_parse_yaml_file_path{fpath});
    auto content = drydock::read_file(fpath);
    return parse_yaml_string(content);
}

YAML::Node drydock::parse_yaml_string(std::string_view sv) {
    try {
        return YAML::Load(std::string(sv));
    } catch (YAML::Exception const& exc) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_config>("Invalid YAML: {}",
                                                                         exc.what()),
                                   e_yaml_parse_error{exc.what()});
    }
}
