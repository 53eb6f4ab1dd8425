#include "framevid/data/drive.h"
#include "helper/temp_dir.h"

#include <gtest/gtest.h>

using namespace framevid;

TEST(drive, find_drives) {
    temp_dir tmp;
    tmp.make_dir("split/2011_09_28/2011_09_28_drive_0001_sync");
    tmp.make_dir("split/2011_09_26/2011_09_26_drive_0005_sync");
    tmp.make_dir("split/2011_09_26/2011_09_26_drive_0002_sync/image_02/data");

    const auto drives = data::drive::find_drives(tmp.path() + "/split", "image_02/data");
    ASSERT_EQ(drives.size(), 3);

    EXPECT_EQ(drives.at(0).date_, "2011_09_26");
    EXPECT_EQ(drives.at(0).name_, "2011_09_26_drive_0002");
    EXPECT_EQ(drives.at(0).sync_dir_path_, tmp.path() + "/split/2011_09_26/2011_09_26_drive_0002_sync");
    EXPECT_EQ(drives.at(0).image_dir_path_, tmp.path() + "/split/2011_09_26/2011_09_26_drive_0002_sync/image_02/data");

    EXPECT_EQ(drives.at(1).name_, "2011_09_26_drive_0005");
    EXPECT_EQ(drives.at(2).date_, "2011_09_28");
    EXPECT_EQ(drives.at(2).name_, "2011_09_28_drive_0001");
}

TEST(drive, ignore_non_drive_entries) {
    temp_dir tmp;
    // a file named like a drive
    tmp.make_dir("split/2011_09_26");
    tmp.make_file("split/2011_09_26/2011_09_26_drive_0009_sync");
    // not a sync directory
    tmp.make_dir("split/2011_09_26/calibration");
    tmp.make_dir("split/2011_09_26/_sync");
    // hidden date directory
    tmp.make_dir("split/.trash/2011_09_26_drive_0003_sync");
    // too shallow
    tmp.make_dir("split/2011_09_26_drive_0004_sync");
    // too deep
    tmp.make_dir("split/2011_09_26/extra/2011_09_26_drive_0006_sync");

    EXPECT_TRUE(data::drive::find_drives(tmp.path() + "/split", "image_02/data").empty());
}

TEST(drive, missing_root) {
    temp_dir tmp;
    EXPECT_TRUE(data::drive::find_drives(tmp.path() + "/missing", "image_02/data").empty());
}
