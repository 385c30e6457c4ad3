#include <kaku_edit_application.hpp>

#include <cppext_numeric.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>

int main(int const argc, char** const argv)
{
    try
    {
        kaku_edit::application_t application{
            {const_cast<char const**>(argv), cppext::narrow<size_t>(argc)}};
        return application.run();
    }
    catch (std::exception const& ex)
    {
        spdlog::error("Unhandled exception: {}", ex.what());
    }

    return EXIT_FAILURE;
}
