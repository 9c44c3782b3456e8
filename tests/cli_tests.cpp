#include <cstdlib>

#include <catch2/catch_test_macros.hpp>

#include <QCryptographicHash>
#include <QFile>

#include <fmt/format.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <anycard/qt_util.hpp>
#include <anycard/util.hpp>

static QByteArray hash_pdf_file(const fs::path& file_path)
{
    const auto source_data{
        [&]()
        {
            QFile source_file{ ToQString(file_path) };
            if (!source_file.open(QFile::ReadOnly))
            {
                return QByteArray{};
            }
            return source_file.readAll();
        }()
    };
    const auto id_start{ source_data.lastIndexOf("ID[<") };
    if (id_start < 0)
    {
        return QCryptographicHash::hash(source_data, QCryptographicHash::Md5);
    }
    const auto id_end{ source_data.indexOf(">]", id_start) };
    const auto id_less_data{ source_data.sliced(0, id_start) +
                             source_data.sliced(id_end + 2) };
    return QCryptographicHash::hash(id_less_data, QCryptographicHash::Md5);
}

std::ostream& operator<<(std::ostream& os, const QByteArray& value)
{
    for (auto b : value)
    {
        os << fmt::format("\\x{:0>2x}", static_cast<uint8_t>(b));
    }
    return os;
}

static void WriteTestArtwork()
{
    const cv::Mat artwork(600, 450, CV_8UC3, cv::Scalar(80, 170, 230));
    REQUIRE(cv::imwrite("cli_tests_art.png", artwork));
}

static void CleanupCliFiles()
{
    fs::remove("cli_tests_art.png");
    fs::remove("cli_tests_card.pdf");
    fs::remove("cli_tests_card_again.pdf");
    fs::remove("config.ini");
}

TEST_CASE("Run CLI with help", "[cli_help]")
{
    constexpr char command_line[]{
        ANYCARD_CLI_EXE
        " --help"
    };

    const int ret{ system(command_line) };
    REQUIRE(ret == 0);
}

TEST_CASE("Run CLI with a message", "[cli_card]")
{
    WriteTestArtwork();

    constexpr char command_line[]{
        ANYCARD_CLI_EXE
        " --deterministic"
        " --request"
        " --artwork cli_tests_art.png"
        " --message.text \"Happy Birthday! Love, Sam\""
        " --page.format Letter"
        " --file_name cli_tests_card"
    };

    const int ret{ system(command_line) };
    REQUIRE(ret == 0);
    REQUIRE(fs::exists("cli_tests_card.pdf"));

    constexpr char command_line_again[]{
        ANYCARD_CLI_EXE
        " --deterministic"
        " --request"
        " --artwork cli_tests_art.png"
        " --message.text \"Happy Birthday! Love, Sam\""
        " --page.format Letter"
        " --file_name cli_tests_card_again"
    };
    REQUIRE(system(command_line_again) == 0);

    // Deterministic output only differs in the document id
    REQUIRE(hash_pdf_file("cli_tests_card.pdf") == hash_pdf_file("cli_tests_card_again.pdf"));

    std::atexit(CleanupCliFiles);
}

TEST_CASE("Run CLI with blank message", "[cli_writing_lines]")
{
    WriteTestArtwork();

    constexpr char command_line[]{
        ANYCARD_CLI_EXE
        " --deterministic"
        " --request"
        " --artwork cli_tests_art.png"
        " --file_name cli_tests_card"
    };

    fs::remove("cli_tests_card.pdf");
    const int ret{ system(command_line) };
    REQUIRE(ret == 0);
    REQUIRE(fs::exists("cli_tests_card.pdf"));

    std::atexit(CleanupCliFiles);
}

TEST_CASE("Run CLI with an unknown font tier", "[cli_invalid_tier]")
{
    WriteTestArtwork();

    constexpr char command_line[]{
        ANYCARD_CLI_EXE
        " --request"
        " --artwork cli_tests_art.png"
        " --message.text Hello"
        " --message.font_tier huge"
        " --file_name cli_tests_invalid"
    };

    const int ret{ system(command_line) };
    REQUIRE(ret != 0);
    REQUIRE_FALSE(fs::exists("cli_tests_invalid.pdf"));

    std::atexit(CleanupCliFiles);
}

TEST_CASE("Run CLI without artwork", "[cli_no_artwork]")
{
    constexpr char command_line[]{
        ANYCARD_CLI_EXE
        " --request"
        " --artwork does_not_exist.png"
        " --file_name cli_tests_missing"
    };

    const int ret{ system(command_line) };
    REQUIRE(ret != 0);
    REQUIRE_FALSE(fs::exists("cli_tests_missing.pdf"));

    std::atexit(CleanupCliFiles);
}
