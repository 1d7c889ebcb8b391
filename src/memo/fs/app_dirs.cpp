#include <memo/fs/app_dirs.hpp>

#include <boost/algorithm/string.hpp>

#include <memo/utilities/environment.hpp>

namespace memo {

static void
create_directory_if_needed(file_path const& dir)
{
    if (!exists(dir))
        create_directories(dir);
}

static file_path
get_user_home_dir()
{
    return get_environment_variable("HOME");
}

// Get the base directory named by the XDG variable :variable, falling back
// to :fallback (relative to the user's home directory) if the variable is
// unset or isn't absolute.
static file_path
get_xdg_home(string const& variable, file_path const& fallback)
{
    auto xdg_home = get_optional_environment_variable(variable);
    if (xdg_home)
    {
        file_path dir = *xdg_home;
        // XDG requires absolute paths.
        if (dir.is_absolute())
            return dir;
    }
    return get_user_home_dir() / fallback;
}

file_path
get_user_config_dir(string const& app_name)
{
    auto app_config_dir
        = get_xdg_home("XDG_CONFIG_HOME", ".config") / app_name;
    create_directory_if_needed(app_config_dir);
    return app_config_dir;
}

std::vector<file_path>
get_config_search_path(string const& app_name)
{
    std::vector<file_path> search_path;

    // Check for a user config dir.
    auto user_config_dir
        = get_xdg_home("XDG_CONFIG_HOME", ".config") / app_name;
    if (exists(user_config_dir))
        search_path.push_back(user_config_dir);

    // Get the list of XDG base config dirs.
    auto xdg_config_dirs
        = get_optional_environment_variable("XDG_CONFIG_DIRS");
    if (!xdg_config_dirs)
        xdg_config_dirs = string("/etc/xdg");
    std::vector<string> dirs;
    boost::split(dirs, *xdg_config_dirs, [](char c) { return c == ':'; });

    // Filter for directories that contain a subdirectory for this app.
    for (auto const& dir : dirs)
    {
        file_path path(dir);
        if (path.is_absolute() && exists(path / app_name))
            search_path.push_back(path / app_name);
    }

    return search_path;
}

file_path
get_user_cache_dir(string const& app_name)
{
    auto app_cache_dir = get_xdg_home("XDG_CACHE_HOME", ".cache") / app_name;
    create_directory_if_needed(app_cache_dir);
    return app_cache_dir;
}

optional<file_path>
search_in_path(std::vector<file_path> const& search_path, file_path const& item)
{
    for (auto const& dir : search_path)
    {
        auto full_path = dir / item;
        if (exists(full_path))
            return some(full_path);
    }
    return none;
}

} // namespace memo
