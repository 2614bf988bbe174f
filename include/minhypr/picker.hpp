#ifndef MINHYPR_PICKER_HPP
#define MINHYPR_PICKER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "minhypr/errors.hpp"
#include "minhypr/minimized_set.hpp"
#include "minhypr/process.hpp"

namespace minhypr {

    class Picker {
      public:
        virtual ~Picker() = default;
        // nullopt when the user dismissed the menu.
        virtual Result<std::optional<WindowId>> choose(const MinimizedSet& set) = 0;
    };

    class RofiPicker : public Picker {
      public:
        RofiPicker(std::string command, std::optional<std::filesystem::path> theme, ProcessRunner runner);

        Result<std::optional<WindowId>> choose(const MinimizedSet& set) override;

        std::vector<std::string>        arguments() const;

      private:
        std::string                          command_;
        std::optional<std::filesystem::path> theme_;
        ProcessRunner                        runner_;
    };

} // namespace minhypr

#endif // MINHYPR_PICKER_HPP
