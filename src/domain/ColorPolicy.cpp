#include "domain/ColorPolicy.hpp"

namespace iconforge::domain {

ColorAction ClassifyColor(const Color& color) {
    if (color.kind() != Color::Kind::Rgba) {
        return ColorAction::Keep;
    }
    if (color == Color::Black()) {
        return ColorAction::Inherit;
    }
    if (color == Color::White()) {
        return ColorAction::Remove;
    }
    return ColorAction::Keep;
}

} // namespace iconforge::domain
