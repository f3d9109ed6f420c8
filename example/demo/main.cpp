// main.cpp - jsondelta interactive demo

#include <jsondelta/differ.h>
#include <jsondelta/errors.h>

#include <iostream>
#include <string>

using namespace jsondelta;

// ============================================================
// Main Application
// ============================================================
namespace jsondelta {
    void demo_diff();
    void demo_sequence_alignment();
    void demo_unpatch();
    void demo_wire_format();
}

namespace {

std::string read_line(const char* prompt)
{
    std::cout << prompt;
    std::string line;
    std::getline(std::cin, line);
    return line;
}

void run_custom_diff()
{
    JsonDiffer differ;
    auto a = read_line("Left JSON:  ");
    auto b = read_line("Right JSON: ");
    try {
        std::cout << "delta = " << differ.diff_text(a, b) << "\n";
        std::cout << "similarity = " << differ.similarity_text(a, b) << "\n";
    } catch (const DeltaError& e) {
        std::cout << "Error: " << e.what() << "\n";
    }
}

void run_custom_patch()
{
    JsonDiffer differ;
    auto base = read_line("Base JSON:  ");
    auto delta = read_line("Delta JSON: ");
    try {
        std::cout << "result = " << differ.patch_text(base, delta) << "\n";
    } catch (const DeltaError& e) {
        std::cout << "Error: " << e.what() << "\n";
    }
}

} // anonymous namespace

int main()
{
    std::cout << "=== jsondelta Demo ===\n";
    std::cout << "Structural diff and patch for JSON-like values\n\n";

    while (true) {
        std::cout << "=== Walkthroughs ===\n";
        std::cout << "D. Structural diff\n";
        std::cout << "A. Sequence alignment\n";
        std::cout << "U. Symmetric syntax / unpatch\n";
        std::cout << "W. Wire format\n";
        std::cout << "\n=== Try It ===\n";
        std::cout << "1. Diff two JSON texts\n";
        std::cout << "2. Patch a JSON text\n";
        std::cout << "\nQ. Quit\n";
        std::cout << "\nChoice: ";

        char choice;
        if (!(std::cin >> choice)) {
            return 0;
        }
        std::cin.ignore();

        switch (choice) {
        case '1':
            run_custom_diff();
            break;
        case '2':
            run_custom_patch();
            break;
        case 'D':
        case 'd':
            jsondelta::demo_diff();
            break;
        case 'A':
        case 'a':
            jsondelta::demo_sequence_alignment();
            break;
        case 'U':
        case 'u':
            jsondelta::demo_unpatch();
            break;
        case 'W':
        case 'w':
            jsondelta::demo_wire_format();
            break;
        case 'Q':
        case 'q':
            std::cout << "Goodbye!\n";
            return 0;
        default:
            std::cout << "Invalid choice!\n";
        }

        std::cout << "\n";
    }
}
