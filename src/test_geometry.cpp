#include "textseg/Errors.hpp"
#include "textseg/Geometry.hpp"

#include <iostream>

using textseg::BBox;

static int failures = 0;

static void check(bool condition, const std::string &name) {
  if (condition) {
    std::cout << "  [PASS] " << name << "\n";
  } else {
    std::cout << "  [FAIL] " << name << "\n";
    failures++;
  }
}

static textseg::ConsolidatedTextBox makeBox(const std::string &text, int x0,
                                            int y0) {
  textseg::ConsolidatedTextBox box;
  box.text = text;
  box.bbox = BBox(x0, y0, x0 + 20, y0 + 10);
  box.confidence = 90.0f;
  return box;
}

int main() {
  std::cout << "=== Geometry ===\n\n";

  std::cout << "[Boxes]\n";
  {
    BBox box(10, 20, 50, 30);
    check(box.width() == 40 && box.height() == 10, "edges are exclusive");
    check(box.area() == 400, "area is width * height");
    check(BBox::fromRect(box.toRect()) == box, "rect conversion is lossless");
    check(BBox(5, 5, 5, 9).isValid() && !BBox(5, 5, 5, 9).hasArea(),
          "zero-width box is valid but empty");
    check(!BBox(10, 0, 5, 5).isValid(), "inverted box is invalid");
  }

  {
    BBox a(0, 0, 10, 10);
    BBox b(5, 5, 20, 30);
    check(textseg::unionOf(a, b) == BBox(0, 0, 20, 30), "union of two boxes");
    check(textseg::intersectionOf(a, b) == BBox(5, 5, 10, 10),
          "intersection of two boxes");
    check(textseg::intersectionOf(a, BBox(50, 50, 60, 60)).area() == 0,
          "disjoint boxes have an empty intersection");
    check(textseg::unionOf(std::vector<BBox>{}) == BBox(),
          "union of nothing is the zero box");
  }

  std::cout << "\n[Remapping]\n";
  {
    BBox region(50, 50, 150, 150);
    BBox local(5, 5, 25, 25);
    check(textseg::remapToPage(local, region, 10) == BBox(45, 45, 65, 65),
          "crop coordinates shift by region origin minus padding");

    // A word inside the white border left of a region at the page edge
    BBox edgeRegion(3, 4, 40, 40);
    check(textseg::remapToPage(BBox(0, 0, 8, 8), edgeRegion, 10) ==
              BBox(0, 0, 1, 2),
          "remapped coordinates are clamped at zero");

    bool threw = false;
    try {
      textseg::remapToPage(BBox(20, 0, 10, 10), region, 10);
    } catch (const textseg::MalformedInputError &) {
      threw = true;
    }
    check(threw, "inverted local box is rejected");

    threw = false;
    try {
      textseg::validateBBox(BBox(0, 10, 10, 5), "test");
    } catch (const textseg::MalformedInputError &e) {
      threw = std::string(e.what()).find("test") != std::string::npos;
    }
    check(threw, "validation error names its context");
  }

  std::cout << "\n[Reading order]\n";
  {
    std::vector<textseg::ConsolidatedTextBox> boxes = {
        makeBox("C", 10, 50), makeBox("B", 100, 3), makeBox("A", 10, 0),
        makeBox("D", 100, 52)};
    textseg::sortByPosition(boxes);

    std::string order;
    for (const auto &box : boxes) {
      order += box.text;
    }
    check(order == "ABCD", "rows top to bottom, left to right within a row");
  }

  std::cout << "\n" << (failures == 0 ? "All tests passed" : "Tests failed")
            << "\n";
  return failures == 0 ? 0 : 1;
}
