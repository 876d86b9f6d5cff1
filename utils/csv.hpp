// utils/csv.hpp
#pragma once
#include <cctype>
#include <cstdio>
#include <fstream>
#include <string>
#include <unordered_map>
#include <vector>

#include "ship/field_visitor.hpp"

namespace utils
{

    // Row-oriented telemetry logger:
    // - header taken from the first row's keys
    // - later rows follow that key order (missing keys left blank, extra keys dropped)
    // - fields quoted when they contain ',', '"' or a line break
    class CsvWriter
    {
    public:
        CsvWriter() = default;

        bool open(const std::string &path)
        {
            close();
            header_.clear();
            rows_ = 0;

            file_.open(path, std::ios::out | std::ios::trunc);
            return file_.is_open();
        }

        bool is_open() const { return file_.is_open(); }

        bool write_row(const ship::FieldList &row)
        {
            if (!file_.is_open())
                return false;

            if (header_.empty())
            {
                for (const auto &kv : row)
                    header_.push_back(kv.first);
                write_line(header_);
            }

            std::unordered_map<std::string, const ship::FieldValue *> by_key;
            for (const auto &kv : row)
                by_key.emplace(kv.first, &kv.second);

            std::vector<std::string> cells;
            cells.reserve(header_.size());
            for (const auto &key : header_)
            {
                auto it = by_key.find(key);
                cells.push_back(it == by_key.end() ? std::string() : format_cell(*it->second));
            }
            write_line(cells);

            ++rows_;
            return static_cast<bool>(file_);
        }

        void flush()
        {
            if (file_.is_open())
                file_.flush();
        }

        void close()
        {
            if (file_.is_open())
                file_.close();
        }

        const std::vector<std::string> &header() const { return header_; }

        // Data rows, header excluded
        size_t rows_written() const { return rows_; }

        static std::string escape(const std::string &field)
        {
            bool needs_quotes = false;
            for (char c : field)
            {
                if (c == ',' || c == '"' || c == '\n' || c == '\r')
                {
                    needs_quotes = true;
                    break;
                }
            }
            if (!needs_quotes)
                return field;

            std::string out;
            out.reserve(field.size() + 2);
            out.push_back('"');
            for (char c : field)
            {
                if (c == '"')
                    out.push_back('"');
                out.push_back(c);
            }
            out.push_back('"');
            return out;
        }

        // Doubles keep 10 significant digits; bools and strings as in format_value()
        static std::string format_cell(const ship::FieldValue &value)
        {
            if (const double *d = std::get_if<double>(&value))
            {
                char buf[64];
                std::snprintf(buf, sizeof(buf), "%.10g", *d);
                return buf;
            }
            return ship::format_value(value);
        }

    private:
        void write_line(const std::vector<std::string> &cells)
        {
            for (size_t i = 0; i < cells.size(); ++i)
            {
                if (i)
                    file_ << ',';
                file_ << escape(cells[i]);
            }
            file_ << '\n';
        }

        std::ofstream file_;
        std::vector<std::string> header_;
        size_t rows_ = 0;
    };

    // Minimal CSV reader: header -> column index, quoted fields, blank skipping
    class CsvReader
    {
    public:
        CsvReader() = default;

        bool open(const std::string &path)
        {
            file_.open(path);
            if (!file_.is_open())
                return false;

            header_.clear();
            col_index_.clear();

            std::string line;
            if (!std::getline(file_, line))
                return false;

            header_ = parse_line(line);
            for (size_t i = 0; i < header_.size(); ++i)
                col_index_[header_[i]] = static_cast<int>(i);
            return true;
        }

        bool read_row(std::vector<std::string> &out)
        {
            out.clear();
            if (!file_.is_open())
                return false;

            std::string line;
            while (std::getline(file_, line))
            {
                if (is_blank(line))
                    continue;

                out = parse_line(line);
                if (out.size() < header_.size())
                    out.resize(header_.size());
                return true;
            }
            return false;
        }

        const std::vector<std::string> &header() const { return header_; }

        int col(const std::string &name) const
        {
            auto it = col_index_.find(name);
            if (it == col_index_.end())
                return -1;
            return it->second;
        }

        std::string get(const std::vector<std::string> &row,
                        const std::string &col_name) const
        {
            int idx = col(col_name);
            if (idx < 0 || static_cast<size_t>(idx) >= row.size())
                return "";
            return row[static_cast<size_t>(idx)];
        }

        static double to_double(const std::string &s, double default_val = 0.0)
        {
            if (s.empty())
                return default_val;
            return std::stod(s);
        }

    private:
        static bool is_blank(const std::string &s)
        {
            for (char c : s)
                if (!std::isspace(static_cast<unsigned char>(c)))
                    return false;
            return true;
        }

        static std::vector<std::string> parse_line(const std::string &line)
        {
            std::vector<std::string> fields;
            std::string cur;
            bool in_quotes = false;

            for (size_t i = 0; i < line.size(); ++i)
            {
                char c = line[i];
                if (in_quotes)
                {
                    if (c != '"')
                        cur.push_back(c);
                    else if (i + 1 < line.size() && line[i + 1] == '"')
                        cur.push_back(line[++i]);
                    else
                        in_quotes = false;
                }
                else if (c == '"')
                    in_quotes = true;
                else if (c == ',')
                {
                    fields.push_back(cur);
                    cur.clear();
                }
                else
                    cur.push_back(c);
            }
            fields.push_back(cur);
            return fields;
        }

        std::ifstream file_;
        std::vector<std::string> header_;
        std::unordered_map<std::string, int> col_index_;
    };

} // namespace utils
