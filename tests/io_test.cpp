#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "sigmar/errors.hpp"
#include "sigmar/io.hpp"
#include "test_helpers.hpp"

using namespace sigmar;
using sigmar_test::logspace;

namespace fs = std::filesystem;

class TableIOTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = fs::temp_directory_path() /
      (std::string("sigmar_") + info->test_suite_name() + "_" + info->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::string write_file(const std::string& name, const std::string& content) const {
    const fs::path path = dir_ / name;
    std::ofstream out(path);
    out << content;
    return path.string();
  }

  fs::path dir_;
};

TEST_F(TableIOTest, ReadTableSkipsCommentsAndBlankLines) {
  const std::string file = write_file("t.txt",
    "# k P\n"
    "\n"
    "1.0  2.0\t3.0\n"
    "   # indented comment\n"
    "4.0 5.0e-1 -6\r\n"
    "\n");
  const arma::Mat<double> t = read_table(file);
  ASSERT_EQ(t.n_rows, 2u);
  ASSERT_EQ(t.n_cols, 3u);
  EXPECT_DOUBLE_EQ(t(0,2), 3.0);
  EXPECT_DOUBLE_EQ(t(1,1), 0.5);
  EXPECT_DOUBLE_EQ(t(1,2), -6.0);
}

TEST_F(TableIOTest, ReadTableErrors) {
  EXPECT_THROW(read_table((dir_ / "missing.txt").string()), TableIOError);
  EXPECT_THROW(read_table(dir_.string()), TableIOError);
  EXPECT_THROW(read_table(write_file("empty.txt", "# nothing\n\n")), TableIOError);
  EXPECT_THROW(read_table(write_file("ragged.txt", "1 2 3\n4 5\n")), TableIOError);
  EXPECT_THROW(read_table(write_file("text.txt", "1 2\n3 abc\n")), TableIOError);
  EXPECT_THROW(read_table(write_file("suffix.txt", "1 2x\n")), TableIOError);
}

TEST_F(TableIOTest, ReadVectorAcceptsRowOrColumn) {
  const arma::Col<double> a = read_vector(write_file("row.txt", "1 2 3\n"));
  const arma::Col<double> b = read_vector(write_file("col.txt", "1\n2\n3\n"));
  ASSERT_EQ(a.n_elem, 3u);
  EXPECT_TRUE(arma::approx_equal(a, b, "absdiff", 0.0));
  EXPECT_THROW(read_vector(write_file("mat.txt", "1 2\n3 4\n")), TableIOError);
}

TEST_F(TableIOTest, ReadPowerSpectrumSection) {
  write_file("k_h.txt", "0.01\n0.1\n1.0\n");
  write_file("z.txt", "0.0\n1.0\n");
  write_file("p_k.txt", "100 25\n10 2.5\n1 0.25\n");
  const PowerSpectrumTable pk = read_power_spectrum_section(dir_.string());
  EXPECT_EQ(pk.nk(), 3);
  EXPECT_EQ(pk.nz(), 2);
  EXPECT_NEAR(pk.power(0.1, 1.0), 2.5, 1e-12);
  EXPECT_NEAR(pk.power(std::sqrt(0.1), 0.0), std::sqrt(10.0), 1e-9);
}

TEST_F(TableIOTest, ReadPowerSpectrumSectionRedshiftMajor) {
  write_file("k_h.txt", "0.01 0.1 1.0\n");
  write_file("z.txt", "0.0 1.0\n");
  write_file("p_k.txt", "100 10 1\n25 2.5 0.25\n");
  const PowerSpectrumTable pk = read_power_spectrum_section(dir_.string());
  ASSERT_EQ(pk.get_P().n_rows, 3u);
  ASSERT_EQ(pk.get_P().n_cols, 2u);
  EXPECT_DOUBLE_EQ(pk.get_P()(0,1), 25.0);
  EXPECT_DOUBLE_EQ(pk.get_P()(2,0), 1.0);
}

TEST_F(TableIOTest, ReadPowerSpectrumSectionErrors) {
  EXPECT_THROW(read_power_spectrum_section(dir_.string()), TableIOError);

  write_file("k_h.txt", "0.01\n0.1\n1.0\n");
  write_file("z.txt", "0.0\n1.0\n");
  write_file("p_k.txt", "1 2 3 4\n5 6 7 8\n");
  EXPECT_THROW(read_power_spectrum_section(dir_.string()), InvalidGridError);
}

TEST_F(TableIOTest, WriteVarianceSection) {
  VarianceTable table;
  table.R = arma::Col<double>{1.0, 8.0, 20.0};
  table.z = arma::Col<double>{0.0, 0.5};
  table.sigma2 = {{3.5, 2.1}, {0.75, 0.45}, {0.125, 0.075}};

  const fs::path out = dir_ / "nested" / "sigmar";
  write_variance_section(out.string(), table);

  const arma::Col<double> R = read_vector((out / "r.txt").string());
  const arma::Col<double> z = read_vector((out / "z.txt").string());
  const arma::Mat<double> s2 = read_table((out / "sigma2.txt").string());
  EXPECT_TRUE(arma::approx_equal(R, table.R, "reldiff", 1e-12));
  EXPECT_TRUE(arma::approx_equal(z, table.z, "reldiff", 1e-12));
  EXPECT_TRUE(arma::approx_equal(s2, table.sigma2, "reldiff", 1e-12));
}

TEST_F(TableIOTest, WriteVarianceSectionShapeMismatchThrows) {
  VarianceTable table;
  table.R = arma::Col<double>{1.0, 8.0};
  table.z = arma::Col<double>{0.0};
  table.sigma2 = arma::Mat<double>(1, 2, arma::fill::zeros);
  EXPECT_THROW(write_variance_section((dir_ / "bad").string(), table), InvalidGridError);
}
