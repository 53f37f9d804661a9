#include "dump.hpp"
#include "../utils/log.hpp"

#include <iomanip>
#include <sstream>

std::string format_tables(const Tables& tables) {
    std::ostringstream oss;

    oss << std::fixed << std::setprecision(6);

    for (auto p = tables.begin(); p != tables.end(); p++) {
        oss << "## Program: " << p->first << "\n\n";

        for (auto t = p->second.begin(); t != p->second.end(); t++) {
            oss << "### Table: " << t->first << "\n\n";

            oss << "```\n";

            for (auto row = t->second.begin(); row != t->second.end(); row++) {
                oss << (*row).raw << " ([";

                for (size_t i = 0; i < (*row).labels.size(); i++) {
                    if (i) oss << " ";
                    oss << (*row).labels[i];
                }

                oss << "]) -> " << (*row).value << "\n";
            }

            oss << "```\n\n";
        }
    }

    return oss.str();
}

void tables_handler(const Exporter& exporter, const httplib::Request&, httplib::Response& res) {
    Tables tables;

    try {
        tables = exporter.tables();
    } catch (const TableError& e) {
        Log::error("Failed to dump tables: ", e.what(), "\n");

        res.status = 500;
        res.set_content(std::string(e.what()) + "\n", "text/plain");
        return;
    }

    res.status = 200;
    res.set_content(format_tables(tables), "text/plain");
}
