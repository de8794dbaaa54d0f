#include "input_module/pixel_matrix.hpp"

#include <stdexcept>

#include "test_support.hpp"

using fw::iom::PixelMatrix;

static void testConstruction() {
    PixelMatrix matrix(9, 34, 7);
    ASSERT_EQ(matrix.width(), static_cast<std::size_t>(9), "width");
    ASSERT_EQ(matrix.height(), static_cast<std::size_t>(34), "height");
    ASSERT_EQ(matrix.size(), static_cast<std::size_t>(306), "cell count");
    ASSERT_EQ(matrix.at(8, 33), 7, "initial value");
}

static void testSetAndAt() {
    PixelMatrix matrix(4, 3);
    matrix.set(3, 2, 42);
    ASSERT_EQ(matrix.at(3, 2), 42, "value stored at (3, 2)");
    ASSERT_EQ(matrix.cells()[2 * 4 + 3], 42, "row-major layout");
    matrix.set(0, 0, 999);
    ASSERT_EQ(matrix.at(0, 0), 999, "values are stored unclamped");
}

static void testOutOfRange() {
    PixelMatrix matrix(4, 3);
    bool threw = false;
    try {
        matrix.set(4, 0, 1);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "set past the width throws");

    threw = false;
    try {
        (void)matrix.at(0, 3);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "at past the height throws");

    threw = false;
    try {
        matrix.drawBox(0, 0, 4, 2, 1);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "drawBox outside the grid throws");
    ASSERT_EQ(matrix.at(0, 0), 0, "failed drawBox leaves the grid untouched");
}

static void testDrawBox() {
    PixelMatrix matrix(5, 5);
    matrix.drawBox(3, 3, 1, 1, 9);
    int lit = 0;
    for (auto value : matrix.cells()) {
        lit += value == 9 ? 1 : 0;
    }
    ASSERT_EQ(lit, 9, "inclusive 3x3 box with reversed corners");
    ASSERT_EQ(matrix.at(0, 0), 0, "outside the box");
    ASSERT_EQ(matrix.at(2, 2), 9, "inside the box");
}

static void testFillAndEquality() {
    PixelMatrix a(3, 2);
    PixelMatrix b(3, 2, 5);
    ASSERT_TRUE(a != b, "different values compare unequal");
    a.fill(5);
    ASSERT_TRUE(a == b, "filled matrix matches");
    ASSERT_TRUE(PixelMatrix(2, 3, 5) != b, "transposed shape compares unequal");
}

int main() {
    testConstruction();
    testSetAndAt();
    testOutOfRange();
    testDrawBox();
    testFillAndEquality();
    return finishTests("PixelMatrix");
}
