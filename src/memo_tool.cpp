#include <iostream>

#include <boost/program_options.hpp>

#include <memo/caching/memoizer.hpp>
#include <memo/config.hpp>
#include <memo/core/logging.hpp>
#include <memo/fs/app_dirs.hpp>
#include <memo/readers/fake_reader.hpp>

using namespace memo;

static void
print_description(image_description const& description)
{
    std::cout << "name: " << description.name << "\n"
              << "size: " << description.x_size << " x "
              << description.y_size << " (Z=" << description.z_size
              << ", C=" << description.c_size << ", T=" << description.t_size
              << ")\n"
              << "pixel type: " << to_string(description.element_type) << "\n"
              << "dimension order: " << description.dimension_order << "\n"
              << "planes: " << get_image_count(description) << " of "
              << get_plane_size(description) << " bytes\n";
}

static void
print_report(memo_report const& report)
{
    std::cout << "memo file: "
              << (report.memo_path ? report.memo_path->string() : "(none)")
              << "\n"
              << "lookup: " << to_string(report.lookup) << "\n"
              << "write: " << to_string(report.write) << "\n"
              << "initialization time: "
              << std::chrono::duration_cast<std::chrono::milliseconds>(
                     report.initialization_time)
                     .count()
              << " ms\n";
}

int
main(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    desc.add_options()
        ("help", "show help message")
        ("config-file", po::value<string>(), "specify the configuration file to use")
        ("user-config-path", "print where the user's config.yml belongs")
        ("cache-dir", po::value<string>(), "store memo files under this directory")
        ("user-cache", "store memo files under the user's cache directory")
        ("in-place", "store memo files beside their sources")
        ("minimum-elapsed", po::value<integer>(), "only memoize initializations that take at least this many milliseconds")
        ("memo-path", "only print the memo file path that would be used")
        ("log-level", po::value<string>(), "set the log level (trace, debug, info, warn, err, off)")
        ("source", po::value<string>(), "the source to open")
    ;

    po::positional_options_description positional;
    positional.add("source", 1);

    tool_config config;
    try
    {
        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
            vm);
        po::notify(vm);

        if (vm.count("user-config-path"))
        {
            std::cout << (get_user_config_dir("memo") / "config.yml").string()
                      << "\n";
            return 0;
        }

        if (vm.count("help") || !vm.count("source"))
        {
            std::cout << "usage: memo_tool [options] <source>\n" << desc;
            return vm.count("help") ? 0 : 1;
        }

        optional<file_path> config_path;
        if (vm.count("config-file"))
        {
            config_path = file_path(vm["config-file"].as<string>());
        }
        else
        {
            config_path
                = search_in_path(get_config_search_path("memo"), "config.yml");
        }
        if (config_path)
            config = read_tool_config_file(*config_path);

        apply_environment_overrides(config);

        if (vm.count("cache-dir"))
        {
            config.memo.placement = memo_placement::DIRECTORY;
            config.memo.directory = vm["cache-dir"].as<string>();
        }
        if (vm.count("user-cache"))
        {
            config.memo.placement = memo_placement::DIRECTORY;
            config.memo.directory = get_user_cache_dir("memo");
        }
        if (vm.count("in-place"))
            config.memo.placement = memo_placement::IN_PLACE;
        if (vm.count("minimum-elapsed"))
        {
            config.memo.minimum_elapsed
                = std::chrono::milliseconds(vm["minimum-elapsed"].as<integer>());
        }
        if (vm.count("log-level"))
            config.log_level = vm["log-level"].as<string>();

        initialize_logging(config.log_level);

        memoizer wrapper(std::make_unique<fake_reader>(), config.memo);

        file_path source = vm["source"].as<string>();
        if (vm.count("memo-path"))
        {
            auto memo_path = wrapper.get_memo_path(source);
            std::cout << (memo_path ? memo_path->string() : "(none)") << "\n";
            return memo_path ? 0 : 2;
        }

        auto report = wrapper.open(source);
        print_description(
            static_cast<fake_reader const&>(wrapper.reader()).description());
        print_report(report);
        wrapper.close();
    }
    catch (po::error& e)
    {
        std::cerr << "memo_tool: " << e.what() << "\n";
        return 1;
    }
    catch (std::exception& e)
    {
        std::cerr << "memo_tool: " << boost::diagnostic_information(e) << "\n";
        return 1;
    }
    return 0;
}
