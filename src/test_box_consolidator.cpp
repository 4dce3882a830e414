#include "textseg/BoxConsolidator.hpp"

#include <iostream>
#include <random>

using textseg::BBox;
using textseg::BoxConsolidator;

static int failures = 0;

static void check(bool condition, const std::string &name) {
  if (condition) {
    std::cout << "  [PASS] " << name << "\n";
  } else {
    std::cout << "  [FAIL] " << name << "\n";
    failures++;
  }
}

// True when box j of the set counts as larger than box i: greater area, or
// equal area and earlier in the set
static bool isLarger(const std::vector<BBox> &boxes, size_t j, size_t i) {
  return boxes[j].area() > boxes[i].area() ||
         (boxes[j].area() == boxes[i].area() && j < i);
}

static bool coveredByLarger(const std::vector<BBox> &boxes, size_t i) {
  for (size_t j = 0; j < boxes.size(); j++) {
    if (j != i && isLarger(boxes, j, i) &&
        BoxConsolidator::coverage(boxes[i], boxes[j]) >=
            BoxConsolidator::kContainmentRatio) {
      return true;
    }
  }
  return false;
}

// Random boxes, some nested inside or shrunk slightly from earlier ones,
// some duplicated
static std::vector<BBox> randomBoxes(std::mt19937 &rng) {
  std::uniform_int_distribution<int> count(1, 12);
  std::uniform_int_distribution<int> position(0, 300);
  std::uniform_int_distribution<int> size(1, 80);
  std::uniform_int_distribution<int> kind(0, 3);
  std::uniform_int_distribution<int> margin(0, 2);

  std::vector<BBox> boxes;
  const int n = count(rng);
  for (int i = 0; i < n; i++) {
    const int k = boxes.empty() ? 0 : kind(rng);
    if (k == 0 || k == 1) {
      const int x = position(rng);
      const int y = position(rng);
      boxes.push_back(BBox(x, y, x + size(rng), y + size(rng)));
    } else {
      std::uniform_int_distribution<size_t> pick(0, boxes.size() - 1);
      BBox parent = boxes[pick(rng)];
      if (k == 2) {
        boxes.push_back(parent);
      } else {
        BBox child(parent.x0 + margin(rng), parent.y0 + margin(rng),
                   parent.x1 + margin(rng) - 1, parent.y1 - margin(rng));
        if (child.hasArea()) {
          boxes.push_back(child);
        }
      }
    }
  }
  return boxes;
}

int main() {
  std::cout << "=== Box Consolidator ===\n\n";

  std::cout << "[Merge]\n";
  {
    // Same height, aligned, 10px apart
    BBox a(0, 0, 40, 20);
    BBox b(50, 2, 90, 22);
    check(BoxConsolidator::shouldMerge(a, b), "neighbours on a line merge");
    check(BoxConsolidator::shouldMerge(b, a), "merge test is symmetric");

    auto merged = BoxConsolidator::mergeBoxes({b, a});
    check(merged.size() == 1 && merged[0] == BBox(0, 0, 90, 22),
          "merged box is the union");
  }

  {
    BBox title(0, 0, 40, 20);
    BBox caption(45, 0, 80, 10);
    check(!BoxConsolidator::shouldMerge(title, caption),
          "boxes of different height stay apart");

    BBox far(200, 0, 240, 20);
    check(!BoxConsolidator::shouldMerge(title, far),
          "distant boxes stay apart");

    BBox below(0, 15, 40, 35);
    check(!BoxConsolidator::shouldMerge(title, below),
          "boxes with little vertical overlap stay apart");
  }

  {
    // a-b and b-c are close, a-c is not: merging continues until stable
    std::vector<BBox> chain = {BBox(0, 0, 20, 20), BBox(30, 0, 50, 20),
                               BBox(60, 0, 80, 20), BBox(0, 100, 20, 120)};
    auto merged = BoxConsolidator::mergeBoxes(chain);
    check(merged.size() == 2, "chained boxes collapse into one");
    if (merged.size() == 2) {
      check(merged[0] == BBox(0, 0, 80, 20), "chain spans all three");
      check(merged[1] == BBox(0, 100, 20, 120), "other line is untouched");
    }

    auto again = BoxConsolidator::mergeBoxes(merged);
    check(again == merged, "merging is idempotent");
  }

  {
    check(BoxConsolidator::mergeBoxes({}).empty(), "no boxes, no merges");
  }

  std::cout << "\n[Containment]\n";
  {
    BBox outer(0, 0, 100, 100);
    BBox inner(10, 10, 20, 20);
    BBox partial(80, 80, 150, 150);

    auto filtered = BoxConsolidator::filterContainedBoxes({inner, outer, partial});
    check(filtered.size() == 2, "contained box is removed");
    if (filtered.size() == 2) {
      check(filtered[0] == outer && filtered[1] == partial,
            "survivors keep their input order");
    }

    auto again = BoxConsolidator::filterContainedBoxes(filtered);
    check(again == filtered, "filtering is idempotent");
  }

  {
    BBox outer(0, 0, 100, 100);
    // 100px strip with 99px inside the outer box
    BBox mostlyInside(1, 50, 101, 51);
    // 100px strip with 98px inside
    BBox halfOut(2, 50, 102, 51);

    check(BoxConsolidator::coverage(mostlyInside, outer) >= 0.99,
          "99 of 100 pixels is 99% coverage");
    auto filtered = BoxConsolidator::filterContainedBoxes({outer, mostlyInside});
    check(filtered.size() == 1, "99% covered box is removed");

    filtered = BoxConsolidator::filterContainedBoxes({outer, halfOut});
    check(filtered.size() == 2, "98% covered box is kept");
  }

  {
    BBox box(5, 5, 50, 50);
    auto filtered = BoxConsolidator::filterContainedBoxes({box, box, box});
    check(filtered.size() == 1 && filtered[0] == box,
          "duplicates collapse to one box");
  }

  {
    // Nested three deep: only the outermost survives
    std::vector<BBox> nested = {BBox(20, 20, 30, 30), BBox(10, 10, 40, 40),
                                BBox(0, 0, 50, 50)};
    auto filtered = BoxConsolidator::filterContainedBoxes(nested);
    check(filtered.size() == 1 && filtered[0] == BBox(0, 0, 50, 50),
          "nested boxes reduce to the outermost");
  }

  {
    // B is just inside A, C lies inside B but sticks out of A
    BBox a(0, 10, 101, 1010);
    BBox b(0, 0, 100, 1000);
    BBox c(0, 0, 100, 5);
    auto filtered = BoxConsolidator::filterContainedBoxes({a, b, c});
    check(filtered.size() == 1 && filtered[0] == a,
          "box inside a removed box is removed too");
  }

  std::cout << "\n[Random box sets]\n";
  {
    std::mt19937 rng(20240611);
    bool mergeIdempotent = true;
    bool mergeContains = true;
    bool filterIdempotent = true;
    bool survivorsUncovered = true;
    bool removedCovered = true;

    for (int round = 0; round < 300; round++) {
      std::vector<BBox> boxes = randomBoxes(rng);

      auto merged = BoxConsolidator::mergeBoxes(boxes);
      if (BoxConsolidator::mergeBoxes(merged) != merged) {
        mergeIdempotent = false;
      }
      for (const BBox &input : boxes) {
        bool inside = false;
        for (const BBox &output : merged) {
          if (output.contains(input)) {
            inside = true;
            break;
          }
        }
        if (!inside) {
          mergeContains = false;
        }
      }

      auto filtered = BoxConsolidator::filterContainedBoxes(boxes);
      if (BoxConsolidator::filterContainedBoxes(filtered) != filtered) {
        filterIdempotent = false;
      }

      // Survivors come back in input order, so walk both lists together
      size_t next = 0;
      for (size_t i = 0; i < boxes.size(); i++) {
        const bool kept = next < filtered.size() && filtered[next] == boxes[i];
        if (kept) {
          next++;
        }
        const bool covered = coveredByLarger(boxes, i);
        if (kept && covered) {
          survivorsUncovered = false;
        }
        if (!kept && !covered) {
          removedCovered = false;
        }
      }
      if (next != filtered.size()) {
        survivorsUncovered = false;
      }
    }

    check(mergeIdempotent, "merging twice equals merging once");
    check(mergeContains, "every input box lies inside a merged box");
    check(filterIdempotent, "filtering twice equals filtering once");
    check(survivorsUncovered, "no survivor is covered by a larger box");
    check(removedCovered, "every removed box is covered by a larger box");
  }

  std::cout << "\n[Size filter]\n";
  {
    std::vector<BBox> boxes = {BBox(0, 0, 9, 50), BBox(0, 0, 50, 9),
                               BBox(0, 0, 10, 10), BBox(0, 0, 60, 40)};
    auto filtered = BoxConsolidator::filterSmallBoxes(boxes, 10);
    check(filtered.size() == 2, "boxes below the minimum size are dropped");
    if (filtered.size() == 2) {
      check(filtered[0] == BBox(0, 0, 10, 10), "minimum size is inclusive");
    }
  }

  std::cout << "\n" << (failures == 0 ? "All tests passed" : "Tests failed")
            << "\n";
  return failures == 0 ? 0 : 1;
}
