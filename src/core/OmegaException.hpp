#ifndef SKIRMISH_OMEGAEXCEPTION_HPP
#define SKIRMISH_OMEGAEXCEPTION_HPP

#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace skirmish::core
{
    // Engine-misuse exception: message + typed payload + where it was raised.
    // Never used for ordinary rule rejections, those travel as std::expected.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        virtual ~OmegaException() = default;

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        auto data() const noexcept -> T const& { return usr_data_; }

        // Origin line followed by the captured frames, innermost first
        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("{}:{} in `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.function_name());
            for (auto const& frame : backtrace_)
            {
                if (frame.source_file().empty()) continue;
                s += std::format("  at {}({})\n", frame.source_file(), frame.source_line());
            }
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

template <class T>
struct std::formatter<skirmish::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(skirmish::core::OmegaException<T> const& e, FormatContext& ctx) const
    {
        std::string const s = std::format("error code {}: {}\n{}", static_cast<int>(e.data()), e.what(),
                                          e.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //SKIRMISH_OMEGAEXCEPTION_HPP
