/**
 * @file rect_basics.cpp
 * @brief 示例：矩形基本操作 / Example: Basic Rectangle Operations
 */

#include <QiGeom/QiGeom.h>
#include <cstdio>

using namespace Qi::Geom;

int main() {
    printf("=== QiGeom Sample: Basic Rectangle Operations (v%s) ===\n\n", GetVersion());

    // 1. 创建矩形 / Create rectangles
    printf("1. Creating rectangles...\n");
    Rect window(100.0f, 100.0f, 200.0f, 200.0f);
    Rect column(125.0f, 50.0f, 175.0f, 500.0f);
    Rect below(100.0f, 200.0f, 200.0f, 300.0f);
    printf("   window: %s, size %gx%g\n",
           window.ToString().c_str(), window.Width(), window.Height());
    printf("   column: %s\n", column.ToString().c_str());
    printf("   below:  %s\n", below.ToString().c_str());

    // 2. 求交 / Intersection
    printf("\n2. Intersection:\n");
    if (auto clip = window.Intersect(column)) {
        printf("   window & column = %s\n", clip->ToString().c_str());
    }
    if (!window.Intersect(below)) {
        printf("   window & below  = none (shared edge only)\n");
    }

    // 3. 包含测试（半开区间） / Containment (half-open)
    printf("\n3. Containment:\n");
    Vec2 points[] = {{100.0f, 100.0f}, {199.5f, 150.0f}, {200.0f, 150.0f}};
    for (const Vec2& p : points) {
        printf("   window contains %s: %s\n", ToString(p).c_str(),
               window.Contains(p) ? "yes" : "no");
    }

    // 4. 平移 / Translation
    printf("\n4. Offset:\n");
    URect tile(0, 0, 64, 64);
    UVec2 step(64, 0);
    URect next = tile.WithOffset(step);
    printf("   tile %s -> %s -> %s\n", tile.ToString().c_str(),
           next.ToString().c_str(), next.WithNegativeOffset(step).ToString().c_str());

    // 5. 角点 / Corners
    printf("\n5. Corners of IRect(-10, -10, 10, 5):\n");
    IRect centered(-10, -10, 10, 5);
    for (const IVec2& c : centered.Corners()) {
        printf("   %s\n", ToString(c).c_str());
    }

    // 6. 输入校验 / Validation of untrusted input
    printf("\n6. Validation:\n");
    IRect inverted(10, 0, 0, 10);
    printf("   zero area: %s, positive area: %s\n",
           inverted.IsZeroArea() ? "yes" : "no",
           inverted.IsPositiveArea() ? "yes" : "no");
    try {
        Validate::RequireWellFormed(inverted, "rect_basics");
    } catch (const InvalidArgumentException& e) {
        printf("   rejected: %s\n", e.what());
    }

    printf("\n=== Sample completed ===\n");
    return 0;
}
