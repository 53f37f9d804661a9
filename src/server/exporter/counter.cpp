#include "counter.hpp"

std::vector<std::string> Counter::label_names() const {
    return label_names_of(labels);
}
