#include <gtest/gtest.h>
#include "input/RawMidiInput.hpp"
#include <filesystem>
#include <fstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class RawMidiInputTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() /
               ("footbridge_midi_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root);
        fs::create_directories(root / "dev");
        fs::create_directories(root / "proc");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void addCard(int card, const std::string& id) {
        fs::create_directories(root / "proc" / ("card" + std::to_string(card)));
        std::ofstream(root / "proc" / ("card" + std::to_string(card)) / "id") << id << "\n";
        std::ofstream(root / "dev" / ("midiC" + std::to_string(card) + "D0"));
    }

    std::optional<std::string> find(const std::vector<std::string>& patterns) {
        return RawMidiInput::findDevice(patterns, (root / "dev").string(),
                                        (root / "proc").string());
    }
};

TEST_F(RawMidiInputTest, FindsCardByNamePattern) {
    addCard(0, "PCH");
    addCard(2, "MVAVEChocolate");

    auto dev = find({"chocolate"});
    ASSERT_TRUE(dev.has_value());
    EXPECT_EQ(fs::path(*dev).filename().string(), "midiC2D0");
}

TEST_F(RawMidiInputTest, FirstPatternMatchWinsInNodeOrder) {
    addCard(1, "Bluetooth");
    addCard(3, "Chocolate");

    auto dev = find({"Chocolate", "Bluetooth"});
    ASSERT_TRUE(dev.has_value());
    EXPECT_EQ(fs::path(*dev).filename().string(), "midiC1D0");
}

TEST_F(RawMidiInputTest, CardNumbersCompareNumerically) {
    addCard(10, "Chocolate");
    addCard(2, "Chocolate");

    auto dev = find({"Chocolate"});
    ASSERT_TRUE(dev.has_value());
    EXPECT_EQ(fs::path(*dev).filename().string(), "midiC2D0");
}

TEST_F(RawMidiInputTest, NoMatch) {
    addCard(0, "PCH");
    EXPECT_FALSE(find({"Chocolate"}).has_value());
    EXPECT_FALSE(find({}).has_value());
}

TEST_F(RawMidiInputTest, IgnoresNonMidiNodes) {
    addCard(0, "Chocolate");
    fs::remove(root / "dev" / "midiC0D0");
    std::ofstream(root / "dev" / "pcmC0D0p");
    std::ofstream(root / "dev" / "controlC0");
    EXPECT_FALSE(find({"Chocolate"}).has_value());
}

TEST_F(RawMidiInputTest, MissingDevDirectory) {
    EXPECT_FALSE(RawMidiInput::findDevice({"x"}, (root / "nope").string(),
                                          (root / "proc").string()).has_value());
}

TEST_F(RawMidiInputTest, ReadsEventsFromFifo) {
    auto fifo = root / "midi.fifo";
    ASSERT_EQ(::mkfifo(fifo.c_str(), 0600), 0);

    RawMidiInput input(fifo.string(), {});
    ASSERT_TRUE(input.open());
    EXPECT_EQ(input.describe(), fifo.string());

    int w = ::open(fifo.c_str(), O_WRONLY | O_NONBLOCK);
    ASSERT_GE(w, 0);
    const uint8_t bytes[] = {0xB0, 20, 127, 21, 127};
    ASSERT_EQ(::write(w, bytes, sizeof(bytes)), static_cast<ssize_t>(sizeof(bytes)));

    auto first = input.next(500ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->sourceCode, 20);

    // Second event came in the same read and is buffered
    auto second = input.next(0ms);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->sourceCode, 21);

    EXPECT_FALSE(input.next(20ms).has_value());
    EXPECT_TRUE(input.isOpen());

    // Writer gone: the input reports closed so the caller can reopen
    ::close(w);
    EXPECT_FALSE(input.next(200ms).has_value());
    EXPECT_FALSE(input.isOpen());
}

TEST_F(RawMidiInputTest, OpenFailsForMissingDevice) {
    RawMidiInput input((root / "absent").string(), {});
    EXPECT_FALSE(input.open());
    EXPECT_FALSE(input.isOpen());
}
