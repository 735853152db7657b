#include <gtest/gtest.h>

#include <string>

#include "intake_api/routes.hpp"

namespace intake_api {

TEST(RoutesTest, PlainFilenameIsKept) {
  EXPECT_EQ(Routes::safe_upload_name("sales.csv"), std::optional<std::string>("sales.csv"));
  EXPECT_EQ(Routes::safe_upload_name("archive.tar.json"),
            std::optional<std::string>("archive.tar.json"));
}

TEST(RoutesTest, DirectoryPartsAreStripped) {
  EXPECT_EQ(Routes::safe_upload_name("../../etc/passwd"), std::optional<std::string>("passwd"));
  EXPECT_EQ(Routes::safe_upload_name("/abs/path/data.xlsx"),
            std::optional<std::string>("data.xlsx"));
  EXPECT_EQ(Routes::safe_upload_name("C:\\Users\\me\\report.tsv"),
            std::optional<std::string>("report.tsv"));
}

TEST(RoutesTest, UnusableNamesAreRejected) {
  EXPECT_FALSE(Routes::safe_upload_name("").has_value());
  EXPECT_FALSE(Routes::safe_upload_name(".").has_value());
  EXPECT_FALSE(Routes::safe_upload_name("..").has_value());
  EXPECT_FALSE(Routes::safe_upload_name("dir/").has_value());
  EXPECT_FALSE(Routes::safe_upload_name("some/..").has_value());
  EXPECT_FALSE(Routes::safe_upload_name(std::string("bad\0name.csv", 12)).has_value());
}

}  // namespace intake_api
