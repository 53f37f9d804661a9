#ifndef _DUMP_H
#define _DUMP_H

#include "exporter.hpp"

#include <httplib.h>

// 把内核表渲染为 markdown 风格的纯文本
std::string format_tables(const Tables& tables);

// GET /tables
void tables_handler(const Exporter& exporter, const httplib::Request& req, httplib::Response& res);

#endif
