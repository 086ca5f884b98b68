/**
 * test_cli.cpp - Tests for the batch driver helpers and option parsing
 */
#undef NDEBUG
#include <cassert>

#include "cli/cli_app.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Fresh, empty scratch directory under the system temp dir
fs::path scratch_dir(const std::string& name) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("vwt_" + name + "_" + std::to_string(stamp));
    fs::create_directories(dir);
    return dir;
}

void touch(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

int run_cli(std::vector<std::string> args) {
    args.insert(args.begin(), "VideoWatermarkTool");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    return vwt::cli::run(static_cast<int>(argv.size()), argv.data());
}

void test_collect_videos_filters() {
    const fs::path dir = scratch_dir("collect");
    touch(dir / "notes.txt", "not a video");
    touch(dir / "broken.mp4", "not a video either");
    fs::create_directories(dir / "nested.mp4");

    assert(vwt::cli::collect_videos(dir).empty());
    assert(vwt::cli::collect_videos(dir / "notes.txt").empty());
    assert(vwt::cli::collect_videos(dir / "broken.mp4").empty());

    fs::remove_all(dir);
    std::cout << "[PASS] Non-video and unreadable files are skipped" << std::endl;
}

void test_output_directory() {
    const fs::path dir = scratch_dir("output");

    const fs::path created = dir / "a" / "b";
    assert(vwt::cli::ensure_directory_writable(created));
    assert(fs::is_directory(created));

    // Existing directory: probe file is cleaned up
    assert(vwt::cli::ensure_directory_writable(created));
    assert(fs::is_empty(created));

    const fs::path file = dir / "plain.txt";
    touch(file, "x");
    assert(!vwt::cli::ensure_directory_writable(file));

    fs::remove_all(dir);
    std::cout << "[PASS] Output directory is created and probed" << std::endl;
}

void test_strategy_option() {
    const fs::path dir = scratch_dir("strategy");
    const std::string input = dir.string();

    // Parsing succeeds, the run then stops on the empty input directory
    for (const char* name : {"original", "as-is", "AS-IS", "resize", "crop"}) {
        assert(run_cli({"-i", input, "-r", "0,0,10,10", "--strategy", name, "-q"}) == 1);
    }

    const int rejected = run_cli({"-i", input, "-r", "0,0,10,10", "--strategy", "tile", "-q"});
    assert(rejected != 0 && rejected != 1);

    fs::remove_all(dir);
    std::cout << "[PASS] --strategy accepts original, as-is, resize, crop" << std::endl;
}

}  // namespace

int main() {
    std::cout << "CLI Tests" << std::endl;

    test_collect_videos_filters();
    test_output_directory();
    test_strategy_option();

    std::cout << std::endl << "All tests passed!" << std::endl;
    return 0;
}
