/**
 * test_region_provider.cpp - Tests for region parsing and the fixed provider
 */
#undef NDEBUG
#include <cassert>

#include "core/region_provider.hpp"
#include "core/types.hpp"
#include "test_support.hpp"

#include <iostream>
#include <stdexcept>
#include <string_view>
#include <vector>

using namespace vwt;
using vwt::test::MemoryFrameSource;
using vwt::test::solid_image;

namespace {

bool rejects(std::string_view text) {
    try {
        (void)parse_region(text);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void test_parse_valid() {
    assert(parse_region("10,20,300,40") == cv::Rect(10, 20, 300, 40));
    assert(parse_region("0,0,1,1") == cv::Rect(0, 0, 1, 1));
    assert(parse_region("5, 6, 7, 8") == cv::Rect(5, 6, 7, 8));
    assert(parse_region("  5,6,7,8") == cv::Rect(5, 6, 7, 8));
    std::cout << "[PASS] x,y,w,h parses, leading spaces allowed" << std::endl;
}

void test_parse_malformed() {
    assert(rejects(""));
    assert(rejects("1,2,3"));
    assert(rejects("1,2,3,4,5"));
    assert(rejects("1,2,3,4x"));
    assert(rejects("1,2,,4"));
    assert(rejects("a,b,c,d"));
    assert(rejects("1,2,3,4 "));
    std::cout << "[PASS] Missing fields and trailing junk are rejected" << std::endl;
}

void test_parse_bounds() {
    assert(rejects("-1,0,10,10"));
    assert(rejects("0,-5,10,10"));
    assert(rejects("0,0,0,10"));
    assert(rejects("0,0,10,0"));
    assert(rejects("0,0,-10,10"));
    std::cout << "[PASS] Negative origin and empty size are rejected" << std::endl;
}

void test_fixed_provider() {
    MemoryFrameSource source(std::vector<cv::Mat>(3, solid_image(cv::Size(200, 100), 0)));

    FixedRegionProvider inside(cv::Rect(100, 50, 100, 50));
    assert(inside.select(source) == cv::Rect(100, 50, 100, 50));

    FixedRegionProvider outside(cv::Rect(150, 50, 100, 50));
    bool threw = false;
    try {
        (void)outside.select(source);
    } catch (const PipelineError& e) {
        threw = e.code() == ErrorCode::InvalidFrameData;
    }
    assert(threw);
    std::cout << "[PASS] Region outside the frame raises InvalidFrameData" << std::endl;
}

}  // namespace

int main() {
    std::cout << "RegionProvider Tests" << std::endl;

    test_parse_valid();
    test_parse_malformed();
    test_parse_bounds();
    test_fixed_provider();

    std::cout << std::endl << "All tests passed!" << std::endl;
    return 0;
}
