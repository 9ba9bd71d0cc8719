#include <cassert>
#include <iostream>

#include "domain/Color.hpp"
#include "domain/ColorPolicy.hpp"

using namespace iconforge::domain;

namespace {

bool ParsesTo(const char* text, const Color& expected) {
    auto color = Color::Parse(text);
    return color && *color == expected;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Color parsing and classification test..." << std::endl;

    // Every notation of black and white reduces to the same value.
    for (const char* black : {"#000", "#000000", "#000f", "#000000ff", "black", "BLACK", " black ",
                              "rgb(0,0,0)", "rgb(0 0 0)", "rgba(0, 0, 0, 1)", "rgb(0% 0% 0% / 100%)",
                              "hsl(0, 0%, 0%)", "hsla(120deg 50% 0% / 1)"}) {
        assert(ParsesTo(black, Color::Black()) && "black notation");
        assert(ClassifyColor(*Color::Parse(black)) == ColorAction::Inherit);
    }
    for (const char* white : {"#fff", "#FFFFFF", "white", "rgb(255,255,255)", "rgb(100%, 100%, 100%)",
                              "hsl(0 0% 100%)", "#ffffffff"}) {
        assert(ParsesTo(white, Color::White()) && "white notation");
        assert(ClassifyColor(*Color::Parse(white)) == ColorAction::Remove);
    }
    std::cout << "[PASS] Black and white notations." << std::endl;

    // Near misses are ordinary colors.
    for (const char* other : {"#010101", "#fefefe", "rgba(0,0,0,0.5)", "#0008", "red", "hsl(210, 50%, 40%)"}) {
        auto color = Color::Parse(other);
        assert(color && color->kind() == Color::Kind::Rgba);
        assert(ClassifyColor(*color) == ColorAction::Keep);
    }
    assert(ParsesTo("red", Color::FromRgba(255, 0, 0)));
    assert(ParsesTo("#f00", Color::FromRgba(255, 0, 0)));
    assert(ParsesTo("rgb(300, -5, 0)", Color::FromRgba(255, 0, 0)));
    assert(ParsesTo("hsl(120, 100%, 50%)", Color::FromRgba(0, 255, 0)));
    std::cout << "[PASS] Other colors are kept." << std::endl;

    // Keywords and paint references are exempt.
    assert(Color::Parse("none")->kind() == Color::Kind::None);
    assert(Color::Parse("none")->isEmpty());
    assert(Color::Parse("transparent")->isEmpty());
    assert(Color::Parse("currentColor")->kind() == Color::Kind::CurrentColor);
    assert(Color::Parse("inherit")->kind() == Color::Kind::Inherit);
    assert(Color::Parse("url(#gradient)")->kind() == Color::Kind::PaintReference);
    assert(Color::Parse("url('#a') red")->kind() == Color::Kind::PaintReference);
    for (const char* keyword : {"none", "transparent", "currentColor", "inherit", "url(#g)"}) {
        assert(ClassifyColor(*Color::Parse(keyword)) == ColorAction::Keep);
    }
    std::cout << "[PASS] Keywords are kept." << std::endl;

    // Garbage is rejected rather than guessed.
    for (const char* bad : {"", "   ", "notacolor", "#12", "#12345", "#ggg", "rgb(1,2)", "rgb(1,2,3,4,5)",
                            "rgb(1, 2 3)", "rgb(a,b,c)", "hsl(10, 20, 30)", "cmyk(0,0,0,0)", "url(#a"}) {
        assert(!Color::Parse(bad) && "invalid color must not parse");
    }
    std::cout << "[PASS] Invalid colors are rejected." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
