#include "./testing.hpp"

#include <drydock/util/fs/io.hpp>

void drydock::testing::write_aged_file(const std::filesystem::path& p,
                                       std::string_view             content,
                                       std::chrono::seconds         age) {
    std::filesystem::create_directories(p.parent_path());
    drydock::write_file(p, content);
    set_age(p, age);
}

void drydock::testing::set_age(const std::filesystem::path& p, std::chrono::seconds age) {
    std::filesystem::last_write_time(p, std::filesystem::file_time_type::clock::now() - age);
}
