#ifndef CPPEXT_OVERLOADED_INCLUDED
#define CPPEXT_OVERLOADED_INCLUDED

namespace cppext
{
    template<class... Ts>
    struct overloaded : Ts...
    {
        using Ts::operator()...;
    };

    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
} // namespace cppext

#endif
