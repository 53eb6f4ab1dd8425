#include "framevid/io/frame_decoder.h"
#include "helper/temp_dir.h"

#include <opencv2/imgcodecs.hpp>

#include <gtest/gtest.h>

using namespace framevid;

TEST(imread_decoder, decode_png) {
    temp_dir tmp;
    const auto img_path = tmp.path() + "/0000000000.png";
    ASSERT_TRUE(cv::imwrite(img_path, cv::Mat(4, 7, CV_8UC1, cv::Scalar::all(128))));

    const io::imread_decoder decoder{};
    const auto img = decoder.decode(img_path);
    ASSERT_FALSE(img.empty());
    EXPECT_EQ(img.cols, 7);
    EXPECT_EQ(img.rows, 4);
    // grayscale images are expanded to BGR
    EXPECT_EQ(img.channels(), 3);
}

TEST(imread_decoder, decode_broken_file) {
    temp_dir tmp;
    const auto img_path = tmp.make_file("0000000000.png", "not an image");

    const io::imread_decoder decoder{};
    EXPECT_TRUE(decoder.decode(img_path).empty());
    EXPECT_TRUE(decoder.decode(tmp.path() + "/missing.png").empty());
}
