#include "framevid/data/frame_sequence.h"
#include "framevid/util/filesystem.h"
#include "helper/temp_dir.h"

#include <gtest/gtest.h>

using namespace framevid;

namespace {

std::vector<std::string> get_file_names(const data::frame_sequence& sequence) {
    std::vector<std::string> file_names;
    for (const auto& path : sequence.get_frame_paths()) {
        file_names.push_back(util::get_basename(path));
    }
    return file_names;
}

} // namespace

TEST(frame_sequence, numerical_order) {
    temp_dir tmp;
    tmp.make_files("frames", {"frame10.png", "frame2.png", "frame1.png", "frame100.png", "frame9.png"});

    const data::frame_sequence sequence(tmp.path() + "/frames", "png");
    EXPECT_TRUE(sequence.is_sorted_numerically());
    ASSERT_EQ(sequence.size(), 5);

    const std::vector<std::string> expected{"frame1.png", "frame2.png", "frame9.png", "frame10.png", "frame100.png"};
    EXPECT_EQ(get_file_names(sequence), expected);
}

TEST(frame_sequence, zero_padded_kitti_names) {
    temp_dir tmp;
    tmp.make_files("data", {"0000000002.png", "0000000000.png", "0000000010.png", "0000000001.png"});

    const data::frame_sequence sequence(tmp.path() + "/data", "png");
    const std::vector<std::string> expected{"0000000000.png", "0000000001.png", "0000000002.png", "0000000010.png"};
    EXPECT_EQ(get_file_names(sequence), expected);
}

TEST(frame_sequence, first_digit_run_is_the_key) {
    temp_dir tmp;
    tmp.make_files("frames", {"cam3_frame1.png", "cam1_frame9.png", "cam2_frame5.png"});

    const data::frame_sequence sequence(tmp.path() + "/frames", "png");
    const std::vector<std::string> expected{"cam1_frame9.png", "cam2_frame5.png", "cam3_frame1.png"};
    EXPECT_EQ(get_file_names(sequence), expected);
}

TEST(frame_sequence, equal_numbers_keep_lexical_order) {
    temp_dir tmp;
    tmp.make_files("frames", {"b_1.png", "a_01.png", "c_0.png"});

    const data::frame_sequence sequence(tmp.path() + "/frames", "png");
    const std::vector<std::string> expected{"c_0.png", "a_01.png", "b_1.png"};
    EXPECT_EQ(get_file_names(sequence), expected);
}

TEST(frame_sequence, lexical_fallback_for_whole_set) {
    temp_dir tmp;
    tmp.make_files("frames", {"frame10.png", "frame2.png", "cover.png", "frame1.png"});

    const data::frame_sequence sequence(tmp.path() + "/frames", "png");
    EXPECT_FALSE(sequence.is_sorted_numerically());

    // no partial numerical order: frame10 precedes frame2
    const std::vector<std::string> expected{"cover.png", "frame1.png", "frame10.png", "frame2.png"};
    EXPECT_EQ(get_file_names(sequence), expected);
}

TEST(frame_sequence, extension_filter) {
    temp_dir tmp;
    tmp.make_files("frames", {"1.png", "2.jpg", "3.PNG", "4.png.bak", ".5.png", "6.png"});
    tmp.make_dir("frames/7.png");
    tmp.make_files("frames/nested", {"8.png"});

    const data::frame_sequence sequence(tmp.path() + "/frames", "png");
    const std::vector<std::string> expected{"1.png", "6.png"};
    EXPECT_EQ(get_file_names(sequence), expected);

    const data::frame_sequence jpg_sequence(tmp.path() + "/frames", "jpg");
    ASSERT_EQ(jpg_sequence.size(), 1);
    EXPECT_EQ(jpg_sequence.get_frame_paths().front(), tmp.path() + "/frames/2.jpg");
}

TEST(frame_sequence, no_frames) {
    temp_dir tmp;
    tmp.make_files("frames", {"1.jpg"});

    const data::frame_sequence sequence(tmp.path() + "/frames", "png");
    EXPECT_TRUE(sequence.empty());

    const data::frame_sequence missing_sequence(tmp.path() + "/missing", "png");
    EXPECT_TRUE(missing_sequence.empty());
}

TEST(frame_sequence, sort_frame_paths) {
    std::vector<std::string> paths{"/a/img_3.png", "/b/img_20.png", "/c/img_1.png"};
    EXPECT_TRUE(data::frame_sequence::sort_frame_paths(paths));
    const std::vector<std::string> expected{"/c/img_1.png", "/a/img_3.png", "/b/img_20.png"};
    EXPECT_EQ(paths, expected);

    // digits in the directory do not count as a key
    std::vector<std::string> unnumbered_paths{"/run2/b.png", "/run1/a.png"};
    EXPECT_FALSE(data::frame_sequence::sort_frame_paths(unnumbered_paths));
    const std::vector<std::string> expected_unnumbered{"/run1/a.png", "/run2/b.png"};
    EXPECT_EQ(unnumbered_paths, expected_unnumbered);
}
