#ifndef MINHYPR_STATUS_HPP
#define MINHYPR_STATUS_HPP

#include <string>

#include "minhypr/minimized_set.hpp"

namespace minhypr {

    // One line per entry: "<id>\t<label>\t<workspace>"
    std::string render_window_list(const MinimizedSet& set);
    std::string render_window_list_json(const MinimizedSet& set);

} // namespace minhypr

#endif // MINHYPR_STATUS_HPP
