#include <catch2/catch_test_macros.hpp>

#include <QString>
#include <QStringList>

#include "cli/commands.hpp"

using namespace ksuid;
using namespace ksuid::cli;

TEST_CASE("CLI: parse_count", "[cli][commands]") {
    REQUIRE(parse_count(QStringLiteral("1")).unwrap() == 1);
    REQUIRE(parse_count(QStringLiteral(" 25 ")).unwrap() == 25);

    for (const auto& bad : {QStringLiteral("0"), QStringLiteral("-3"), QStringLiteral("many"),
                            QStringLiteral("")}) {
        auto result = parse_count(bad);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("CLI: parse_payload_hex", "[cli][commands]") {
    auto bytes = parse_payload_hex(QStringLiteral("00ff10"));
    REQUIRE(bytes.is_ok());
    REQUIRE(bytes.unwrap() == std::vector<std::uint8_t>{0x00, 0xFF, 0x10});

    REQUIRE(parse_payload_hex(QStringLiteral("abc")).is_err());
    REQUIRE(parse_payload_hex(QStringLiteral("zz")).is_err());
}

TEST_CASE("CLI: new generates the requested count", "[cli][commands]") {
    NewOptions options;
    options.count = 3;

    auto output = run_new(options);
    REQUIRE(output.is_ok());

    const auto lines = output.unwrap().split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    REQUIRE(lines.size() == 3);
    for (const auto& line : lines) {
        REQUIRE(line.size() == 27);
        REQUIRE(is_valid_string(line.toStdString()));
    }
    REQUIRE(lines.at(0) != lines.at(1));
}

TEST_CASE("CLI: new with explicit time and payload is deterministic", "[cli][commands]") {
    NewOptions options;
    options.time = QStringLiteral("1507608047");
    options.payload = QStringLiteral("B5A1CD34B5F99D1154FB6853345C9735");

    auto output = run_new(options);
    REQUIRE(output.is_ok());
    REQUIRE(output.unwrap() == QStringLiteral("0ujtsYcgvSTl8PAuAdqWYSMnLOv\n"));
}

TEST_CASE("CLI: new reports bad input", "[cli][commands]") {
    SECTION("Non-numeric time") {
        NewOptions options;
        options.time = QStringLiteral("yesterday");
        auto output = run_new(options);
        REQUIRE(output.is_err());
        REQUIRE(output.unwrap_err().code == ErrorCode::InvalidTimestamp);
    }

    SECTION("Time before the epoch") {
        NewOptions options;
        options.time = QStringLiteral("0");
        REQUIRE(run_new(options).unwrap_err().code == ErrorCode::InvalidTimestamp);
    }

    SECTION("Short payload") {
        NewOptions options;
        options.payload = QStringLiteral("00ff");
        REQUIRE(run_new(options).unwrap_err().code == ErrorCode::InvalidPayloadLength);
    }

    SECTION("Zero count") {
        NewOptions options;
        options.count = 0;
        REQUIRE(run_new(options).unwrap_err().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("CLI: inspect", "[cli][commands]") {
    const QStringList ids{QStringLiteral("0ujtsYcgvSTl8PAuAdqWYSMnLOv"),
                          QStringLiteral("000000000000000000000000000")};

    auto output = run_inspect(ids, OutputFormat::Timestamp);
    REQUIRE(output.is_ok());
    REQUIRE(output.unwrap() == QStringLiteral("1507608047\n1400000000\n"));

    REQUIRE(run_inspect({}, OutputFormat::String).unwrap_err().code == ErrorCode::InvalidArgument);
    REQUIRE(run_inspect({QStringLiteral("bogus")}, OutputFormat::String).unwrap_err().code ==
            ErrorCode::InvalidKSUIDString);
}

TEST_CASE("CLI: next and prev", "[cli][commands]") {
    SECTION("Next") {
        auto output = run_step({QStringLiteral("000000000000000000000000000")},
                               StepDirection::Next, OutputFormat::String);
        REQUIRE(output.unwrap() == QStringLiteral("000000000000000000000000001\n"));
    }

    SECTION("Prev borrows from the timestamp") {
        auto output = run_step({QStringLiteral("000007n42DGM5Tflk9n8mt7Fhc8")},
                               StepDirection::Previous, OutputFormat::String);
        REQUIRE(output.unwrap() == QStringLiteral("000007n42DGM5Tflk9n8mt7Fhc7\n"));
    }

    SECTION("Prev of MIN fails") {
        auto output = run_step({QStringLiteral("000000000000000000000000000")},
                               StepDirection::Previous, OutputFormat::String);
        REQUIRE(output.unwrap_err().code == ErrorCode::InvalidTimestamp);
    }
}

TEST_CASE("CLI: check", "[cli][commands]") {
    const auto report = run_check({QStringLiteral("0ujtsYcgvSTl8PAuAdqWYSMnLOv"),
                                   QStringLiteral("aWgEPTl1tmebfsQzFP4bxwgy80W")});
    REQUIRE_FALSE(report.allValid);
    REQUIRE(report.output == QStringLiteral(
        "0ujtsYcgvSTl8PAuAdqWYSMnLOv valid\n"
        "aWgEPTl1tmebfsQzFP4bxwgy80W invalid\n"));

    REQUIRE(run_check({QStringLiteral("aWgEPTl1tmebfsQzFP4bxwgy80V")}).allValid);
}
