// demo.cpp
// Walkthroughs for diff, patch, unpatch and the wire format
#include <jsondelta/differ.h>
#include <jsondelta/errors.h>
#include <jsondelta/sequence_aligner.h>

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace jsondelta {

namespace {

Value create_order_v1()
{
    return Value::map({
        {"customer", "Alice"},
        {"status", "open"},
        {"tags", Value::set({"priority", "gift"})},
        {"lines", Value::vector({
            Value::map({{"sku", "A-100"}, {"qty", 1}}),
            Value::map({{"sku", "B-200"}, {"qty", 2}}),
            Value::map({{"sku", "C-300"}, {"qty", 1}})
        })}
    });
}

Value create_order_v2()
{
    return Value::map({
        {"customer", "Alice"},
        {"status", "shipped"},
        {"tags", Value::set({"gift", "express"})},
        {"lines", Value::vector({
            Value::map({{"sku", "A-100"}, {"qty", 3}}),
            Value::map({{"sku", "C-300"}, {"qty", 1}}),
            Value::map({{"sku", "D-400"}, {"qty", 1}})
        })},
        {"tracking", "1Z999"}
    });
}

void print_similarity(const JsonDiffer& differ, const Value& a, const Value& b)
{
    std::cout << "similarity = " << std::fixed << std::setprecision(3)
              << differ.similarity(a, b) << "\n";
    std::cout.unsetf(std::ios::fixed);
}

} // anonymous namespace

// ============================================================
// Structural diff of two documents
// ============================================================
void demo_diff()
{
    std::cout << "\n=== Structural Diff Demo ===\n\n";

    JsonDiffer differ;
    auto v1 = create_order_v1();
    auto v2 = create_order_v2();

    std::cout << "Before:\n" << to_json(v1, false, true) << "\n\n";
    std::cout << "After:\n" << to_json(v2, false, true) << "\n\n";

    auto delta = differ.diff(v1, v2);
    std::cout << "Delta:\n" << delta_to_string(delta) << "\n\n";
    print_similarity(differ, v1, v2);

    auto patched = differ.patch(v1, delta);
    std::cout << "patch(before, delta) == after: " << (patched == v2 ? "yes" : "no") << "\n";
}

// ============================================================
// Edit scripts from the sequence aligner
// ============================================================
void demo_sequence_alignment()
{
    std::cout << "\n=== Sequence Alignment Demo ===\n\n";

    std::vector<std::string> x{"the", "quick", "brown", "fox"};
    std::vector<std::string> y{"the", "brown", "lazy", "fox"};

    auto script = SequenceAligner::align(x, y, [](const std::string& a, const std::string& b) {
        return a == b ? 1.0 : 0.0;
    });

    for (const auto& edit : script) {
        switch (edit.op) {
        case EditOp::Match:
            std::cout << "  = " << x[edit.source_pos] << "\n";
            break;
        case EditOp::Delete:
            std::cout << "  - " << x[edit.source_pos] << "\n";
            break;
        case EditOp::Insert:
            std::cout << "  + " << y[edit.target_pos] << "\n";
            break;
        }
    }
}

// ============================================================
// Reversible deltas
// ============================================================
void demo_unpatch()
{
    std::cout << "\n=== Symmetric Syntax / Unpatch Demo ===\n\n";

    DifferOptions opts;
    opts.syntax = builtin_syntax("symmetric");
    JsonDiffer differ{opts};

    auto v1 = create_order_v1();
    auto v2 = create_order_v2();

    auto delta = differ.diff(v1, v2);
    std::cout << "Symmetric delta:\n" << delta_to_string(delta) << "\n\n";

    auto restored = differ.unpatch(v2, delta);
    std::cout << "unpatch(after, delta) == before: " << (restored == v1 ? "yes" : "no") << "\n";

    // The compact syntax drops the old side of each change
    JsonDiffer compact;
    try {
        (void)compact.unpatch(v2, compact.diff(v1, v2));
    } catch (const IrreversibleDeltaError& e) {
        std::cout << "compact unpatch: " << e.what() << "\n";
    }
}

// ============================================================
// Text in, text out
// ============================================================
void demo_wire_format()
{
    std::cout << "\n=== Wire Format Demo ===\n\n";

    JsonDiffer differ;

    const std::string before = R"({"price": 10, "$currency": "EUR", "items": [1, 2, 3]})";
    const std::string after = R"({"price": 12, "$currency": "EUR", "items": [1, 3]})";

    auto wire = differ.diff_text(before, after);
    std::cout << "before: " << before << "\n";
    std::cout << "after:  " << after << "\n";
    std::cout << "delta:  " << wire << "\n";
    std::cout << "patched: " << differ.patch_text(before, wire) << "\n";

    try {
        (void)differ.patch_text(R"({"a": 1})", R"({"$delete": ["b"]})");
    } catch (const MissingKeyError& e) {
        std::cout << "patch error: " << e.what() << "\n";
    }
}

} // namespace jsondelta
