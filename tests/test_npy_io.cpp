#include <gtest/gtest.h>
#include <mxwsort/errors.hpp>
#include <mxwsort/npy_io.hpp>

#include "test_fixtures.hpp"

#include <fstream>

using namespace mxwsort;

class NpyIoTest : public ::testing::Test {
protected:
    /// Write magic, version, length field, header text and payload as given
    std::filesystem::path write_raw(const std::string& name, int major,
                                    const std::string& header,
                                    const std::vector<uint8_t>& payload) {
        auto path = dir_ / name;
        std::ofstream f(path, std::ios::binary);
        const char magic[6] = {'\x93', 'N', 'U', 'M', 'P', 'Y'};
        f.write(magic, 6);
        f.put(static_cast<char>(major));
        f.put(0);
        const uint32_t len = static_cast<uint32_t>(header.size());
        const int len_bytes = major == 1 ? 2 : 4;
        for (int i = 0; i < len_bytes; ++i) {
            f.put(static_cast<char>((len >> (8 * i)) & 0xFF));
        }
        f.write(header.data(), static_cast<std::streamsize>(header.size()));
        f.write(reinterpret_cast<const char*>(payload.data()),
                static_cast<std::streamsize>(payload.size()));
        return path;
    }

    template <class T>
    static std::vector<uint8_t> bytes_of(const std::vector<T>& values) {
        std::vector<uint8_t> out(values.size() * sizeof(T));
        std::memcpy(out.data(), values.data(), out.size());
        return out;
    }

    test::TempDir dir_;
};

TEST_F(NpyIoTest, SaveThenLoadPreservesShapeAndValues) {
    const std::vector<int64_t> values = {3, -1, 4, 1, -5, 9};
    auto path = dir_ / "values.npy";
    save_npy(path, make_npy<int64_t>(values, {3, 2}));

    NpyArray loaded = load_npy(path);
    EXPECT_EQ(loaded.dtype, "<i8");
    EXPECT_EQ(loaded.shape, (std::vector<size_t>{3, 2}));
    EXPECT_EQ(loaded.ndim(), 2u);
    EXPECT_EQ(loaded.size(), 6u);
    EXPECT_EQ(loaded.as<int64_t>(), values);
}

TEST_F(NpyIoTest, SavedHeaderIsAligned) {
    const std::vector<float> values = {1.5f, 2.5f};
    auto path = dir_ / "aligned.npy";
    save_npy(path, make_npy<float>(values, {2}));

    const auto file_size = std::filesystem::file_size(path);
    ASSERT_GT(file_size, 8u);
    const size_t data_offset = file_size - 8;
    EXPECT_EQ(data_offset % 64, 0u);

    std::ifstream f(path, std::ios::binary);
    std::string head(data_offset, '\0');
    f.read(head.data(), static_cast<std::streamsize>(data_offset));
    EXPECT_EQ(head[6], '\x01');
    EXPECT_EQ(head[7], '\x00');
    const size_t header_len = static_cast<uint8_t>(head[8]) |
                              (static_cast<size_t>(static_cast<uint8_t>(head[9])) << 8);
    EXPECT_EQ(10 + header_len, data_offset);
    EXPECT_EQ(head.back(), '\n');
    EXPECT_NE(head.find("'shape': (2,)"), std::string::npos);
    EXPECT_NE(head.find("'fortran_order': False"), std::string::npos);
}

TEST_F(NpyIoTest, ZeroLengthArray) {
    auto path = dir_ / "empty.npy";
    save_npy(path, make_npy<double>(std::span<const double>{}, {0, 2}));

    NpyArray loaded = load_npy(path);
    EXPECT_EQ(loaded.shape, (std::vector<size_t>{0, 2}));
    EXPECT_EQ(loaded.size(), 0u);
    EXPECT_TRUE(loaded.as<double>().empty());
}

TEST_F(NpyIoTest, ConvertsBetweenNumericTypes) {
    const std::vector<int32_t> values = {7, 0, -2};
    auto path = dir_ / "clusters.npy";
    save_npy(path, make_npy<int32_t>(values, {3}));

    NpyArray loaded = load_npy(path);
    EXPECT_EQ(loaded.as<int64_t>(), (std::vector<int64_t>{7, 0, -2}));
    EXPECT_EQ(loaded.as<double>(), (std::vector<double>{7.0, 0.0, -2.0}));
}

TEST_F(NpyIoTest, ReadsHandWrittenVersion1Header) {
    const std::vector<uint8_t> payload = {1, 2, 250};
    auto path = write_raw("v1.npy", 1,
                          "{'descr': '|u1', 'fortran_order': False, 'shape': (3,), }\n",
                          payload);

    NpyArray loaded = load_npy(path);
    EXPECT_EQ(loaded.dtype, "|u1");
    EXPECT_EQ(loaded.as<int>(), (std::vector<int>{1, 2, 250}));
}

TEST_F(NpyIoTest, ReadsVersion2HeaderAndNativeOrderMarker) {
    const std::vector<double> values = {0.25, -8.0};
    auto path = write_raw("v2.npy", 2,
                          "{\"descr\": \"=f8\", \"fortran_order\": false, \"shape\": (1, 2)}\n",
                          bytes_of(values));

    NpyArray loaded = load_npy(path);
    EXPECT_EQ(loaded.dtype, "<f8");
    EXPECT_EQ(loaded.shape, (std::vector<size_t>{1, 2}));
    EXPECT_EQ(loaded.as<double>(), values);
}

TEST_F(NpyIoTest, ReadsScalarShape) {
    const std::vector<int16_t> values = {-12};
    auto path = write_raw("scalar.npy", 1,
                          "{'descr': '<i2', 'fortran_order': False, 'shape': (), }\n",
                          bytes_of(values));

    NpyArray loaded = load_npy(path);
    EXPECT_EQ(loaded.ndim(), 0u);
    EXPECT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded.as<int>(), (std::vector<int>{-12}));
}

TEST_F(NpyIoTest, RejectsFortranOrder) {
    auto path = write_raw("fortran.npy", 1,
                          "{'descr': '<f4', 'fortran_order': True, 'shape': (2, 2), }\n",
                          std::vector<uint8_t>(16, 0));
    EXPECT_THROW(load_npy(path), IoError);
}

TEST_F(NpyIoTest, RejectsBigEndian) {
    auto path = write_raw("big.npy", 1,
                          "{'descr': '>i4', 'fortran_order': False, 'shape': (1,), }\n",
                          std::vector<uint8_t>(4, 0));
    EXPECT_THROW(load_npy(path), IoError);
}

TEST_F(NpyIoTest, RejectsNonNumericDtype) {
    auto path = write_raw("complex.npy", 1,
                          "{'descr': '<c16', 'fortran_order': False, 'shape': (1,), }\n",
                          std::vector<uint8_t>(16, 0));
    EXPECT_THROW(load_npy(path), IoError);
}

TEST_F(NpyIoTest, RejectsTruncatedData) {
    auto path = write_raw("short.npy", 1,
                          "{'descr': '<i8', 'fortran_order': False, 'shape': (4,), }\n",
                          std::vector<uint8_t>(12, 0));
    EXPECT_THROW(load_npy(path), IoError);
}

TEST_F(NpyIoTest, RejectsMissingAndForeignFiles) {
    EXPECT_THROW(load_npy(dir_ / "absent.npy"), IoError);

    auto path = dir_ / "text.npy";
    std::ofstream(path) << "not numpy at all";
    EXPECT_THROW(load_npy(path), IoError);
}

TEST_F(NpyIoTest, SaveToFullDeviceThrows) {
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    const std::vector<int64_t> values = {1, 2, 3};
    EXPECT_THROW(save_npy("/dev/full", make_npy<int64_t>(values, {3})), IoError);
}

TEST_F(NpyIoTest, SaveRejectsShapeMismatch) {
    const std::vector<int32_t> values = {1, 2, 3};
    EXPECT_THROW(save_npy(dir_ / "bad.npy", make_npy<int32_t>(values, {2, 2})), IoError);
}
