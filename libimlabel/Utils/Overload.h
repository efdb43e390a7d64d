#pragma once

namespace iml
{
    // helper for building a visitor out of lambdas (e.g. for `std::visit`)
    template<class... Ts>
    struct Overload : Ts... {
        using Ts::operator()...;
    };
}
