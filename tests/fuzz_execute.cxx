#include <atomic>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "helpers.hxx"
#include "vm.hxx"

namespace {
struct Model {
    std::vector<uint8_t> tape;
    size_t ptr = 0;
    std::string out;
};

// Straightforward interpreter with a linear bracket search, used as the oracle.
Model reference(const std::string& code, size_t tapeSize, const std::string& input) {
    Model m;
    m.tape.assign(tapeSize, 0);
    size_t in = 0;
    for (size_t ip = 0; ip < code.size(); ++ip) {
        switch (code[ip]) {
            case '>':
                m.ptr = (m.ptr + 1) % tapeSize;
                break;
            case '<':
                m.ptr = (m.ptr + tapeSize - 1) % tapeSize;
                break;
            case '+':
                m.tape[m.ptr] = static_cast<uint8_t>((m.tape[m.ptr] + 1) % 256);
                break;
            case '-':
                m.tape[m.ptr] = static_cast<uint8_t>((m.tape[m.ptr] + 255) % 256);
                break;
            case '.':
                m.out += static_cast<char>(m.tape[m.ptr]);
                break;
            case ',':
                m.tape[m.ptr] = in < input.size() ? static_cast<uint8_t>(input[in++]) : 0;
                break;
            case '[':
                if (m.tape[m.ptr] == 0) {
                    int depth = 1;
                    while (depth) {
                        ++ip;
                        if (code[ip] == '[') ++depth;
                        if (code[ip] == ']') --depth;
                    }
                }
                break;
            case ']':
                if (m.tape[m.ptr] != 0) {
                    int depth = 1;
                    while (depth) {
                        --ip;
                        if (code[ip] == ']') ++depth;
                        if (code[ip] == '[') --depth;
                    }
                }
                break;
        }
    }
    return m;
}

// Straight-line code mixed with loops that always terminate.
std::string randomProgram(std::mt19937& gen) {
    static const char ops[] = "+-<>.,";
    static const char* loops[] = {"[-]", "[->+<]", "[->>+<<]", "[-<+>]", "+[-]"};
    std::uniform_int_distribution<int> lenDist(0, 48);
    std::uniform_int_distribution<int> opDist(0, sizeof(ops) - 2);
    std::uniform_int_distribution<int> loopDist(0, 9);
    std::uniform_int_distribution<int> pickLoop(0, 4);
    const int len = lenDist(gen);
    std::string program;
    for (int i = 0; i < len; ++i) {
        if (loopDist(gen) == 0) {
            program += loops[pickLoop(gen)];
        } else {
            program += ops[opDist(gen)];
        }
    }
    return program;
}

std::string randomInput(std::mt19937& gen) {
    std::uniform_int_distribution<int> lenDist(0, 8);
    std::uniform_int_distribution<int> byteDist(0, 255);
    int len = lenDist(gen);
    std::string input;
    input.reserve(len);
    for (int i = 0; i < len; ++i) {
        input += static_cast<char>(byteDist(gen));
    }
    return input;
}
}  // namespace

int main() {
    std::mt19937 gen(123456u);
    // At least three cells so the move loops never land back on their counter.
    std::uniform_int_distribution<int> tapeDist(3, 8);
    for (int i = 0; i < 500; ++i) {
        const std::string code = randomProgram(gen);
        const std::string input = randomInput(gen);
        const size_t tapeSize = static_cast<size_t>(tapeDist(gen));
        std::vector<uint8_t> cells(tapeSize, 0);
        size_t ptr = 0;

        std::atomic_bool done{false};
        std::thread watchdogThread([&done]() {
            for (int i = 0; i < 1000; ++i) {
                if (done.load()) return;
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            std::terminate();
        });
        brisk::Status status;
        std::string out = runProgram(code, cells, ptr, input, brisk::EofBehaviour::Zero, &status);
        done = true;
        watchdogThread.join();

        const Model expected = reference(code, tapeSize, input);
        assert(status == brisk::Status::Ok);
        assert(out == expected.out);
        assert(cells == expected.tape);
        assert(ptr == expected.ptr);
        assert(ptr < tapeSize);
    }
    return 0;
}
