#pragma once

#include <libimlabel/Graphics/Color.h>

#include <string>

namespace iml
{
    // a named, colored category that annotations can refer to by name
    struct Label final {
        friend bool operator==(const Label&, const Label&) = default;

        std::string name;
        Color color = Color::red();
    };
}
