#ifndef _COUNTER_H
#define _COUNTER_H

#include "metric.hpp"

class Counter : public Metric {
  public:
    std::vector<Label> labels;

    std::vector<Label> table_labels() const override {
        return labels;
    }

    std::vector<std::string> label_names() const override;
};

#endif
