#include "filebase/filebase.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>
#include <spdlog/spdlog.h>

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop = true;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    // Parse command line arguments
    std::filesystem::path config_file;
    std::string path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                config_file = argv[++i];
            }
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: filebase-demo [options] <path>\n"
                      << "Options:\n"
                      << "  -c, --config <file>  YAML settings (log-level, watch, notifications)\n"
                      << "  -h, --help           Show this help\n"
                      << "\nOpens <path> (creating it if needed), stores some data in it and\n"
                      << "watches it. Rename, move or delete the file and see what happens.\n"
                      << "Press Ctrl+C to exit.\n";
            return 0;
        } else {
            path = arg;
        }
    }

    if (path.empty()) {
        std::cerr << "Error: no file given, see --help" << std::endl;
        return 1;
    }

    filebase::Config config;
    if (!config_file.empty()) {
        auto config_res = filebase::Config::load(config_file);
        if (!config_res) {
            std::cerr << "Failed to load config: " << filebase::error_msg(config_res) << std::endl;
            return 1;
        }
        config = *config_res;
    }
    spdlog::set_level(config.log_level);

    auto serializer = filebase::YamlSerializer::create();
    auto watcher = filebase::InotifyWatchSource::create(config.watch_poll_interval);
    auto dispatcher = filebase::Dispatcher::create();
    if (!serializer || !watcher || !dispatcher) {
        std::cerr << "Failed to set up: " << filebase::error_msg(serializer)
                  << filebase::error_msg(watcher) << filebase::error_msg(dispatcher) << std::endl;
        return 1;
    }

    auto relocated = (*dispatcher)->register_event_handler("file-handle/relocated", [](const filebase::Dict& event) {
        if (auto p = filebase::get_as<std::string>(event.at("path"))) {
            std::cout << "File is now at " << *p << std::endl;
        }
        return filebase::Ok();
    });
    if (!relocated) {
        std::cerr << filebase::error_msg(relocated) << std::endl;
        return 1;
    }

    filebase::FileHandleOptions options;
    options.serializer = *serializer;
    options.watch_source = *watcher;
    options.dispatcher = *dispatcher;
    options.notification_capacity = config.notification_capacity;

    auto file_res = filebase::FileHandle::create(path, options);
    if (!file_res) {
        std::cerr << "Failed to open " << path << ": " << filebase::error_msg(file_res) << std::endl;
        return 1;
    }
    auto file = *file_res;

    std::cout << std::boolalpha;
    std::cout << "It is " << file->has_unsaved_changes() << " that there are unsaved changes in this file" << std::endl;
    std::cout << "Adding some data to the file" << std::endl;
    file->set_data(filebase::Value(std::string("SOME BOGUS DATA")));
    std::cout << "Now it is " << file->has_unsaved_changes() << " that there are unsaved changes in this file" << std::endl;

    std::cout << "Saving file..." << std::endl;
    if (auto res = file->save(); !res) {
        std::cerr << "Save failed: " << res.error().to_string() << std::endl;
        return 1;
    }
    std::cout << "Now it is " << file->has_unsaved_changes() << " that there are unsaved changes in this file" << std::endl;

    std::cout << "Watching the file, press Ctrl+C to exit" << std::endl;
    std::cout << "Feel free to rename or delete the file and see what happens..." << std::endl;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (!g_stop) {
        std::this_thread::sleep_for(config.watch_poll_interval);
        for (const auto& note : file->take_notifications()) {
            std::cout << note.error.message() << std::endl;
            if (note.error.code() == filebase::ErrorCode::FileDeleted) {
                std::cout << "Saving again recreates " << note.identity.file_name() << std::endl;
            }
        }
    }

    std::cout << "\nClosing file demo, goodbye!" << std::endl;
    if (auto res = file->dispose(); !res) {
        std::cerr << "Dispose failed: " << res.error().to_string() << std::endl;
        return 1;
    }
    return 0;
}
