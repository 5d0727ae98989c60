#pragma once
#include <cctype>
#include <cstdint>
#include <fstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace utils
{

    // Minimal CSV reader with:
    // - configurable delimiter (',' for bus logs, ';' for catalog tables)
    // - header → column index
    // - quoted fields
    // - comment / blank skipping
    // - typed helpers (bool / int / double)
    class CsvReader
    {
    public:
        explicit CsvReader(char delimiter = ',') : delim_(delimiter) {}

        bool open(const std::string &path)
        {
            file_.open(path);
            if (!file_.is_open())
                return false;

            header_.clear();
            col_index_.clear();
            line_no_ = 0;

            std::string line;
            if (!std::getline(file_, line))
                return false;
            ++line_no_;

            strip_cr(line);
            strip_bom(line);
            header_ = parse_line(line);
            for (size_t i = 0; i < header_.size(); ++i)
            {
                trim_inplace(header_[i]);
                col_index_[header_[i]] = static_cast<int>(i);
            }
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
                ++line_no_;
                strip_cr(line);
                if (is_blank(line))
                    continue;
                if (!line.empty() && line[0] == '#')
                    continue;

                out = parse_line(line);
                if (out.size() < header_.size())
                    out.resize(header_.size());

                for (auto &cell : out)
                    trim_inplace(cell);

                return true;
            }
            return false;
        }

        int col(const std::string &name) const
        {
            auto it = col_index_.find(name);
            if (it == col_index_.end())
                return -1;
            return it->second;
        }

        bool has_column(const std::string &name) const { return col(name) >= 0; }

        const std::vector<std::string> &header() const { return header_; }

        // Line number of the last row returned by read_row (1 = header)
        int line_no() const { return line_no_; }

        std::string get(const std::vector<std::string> &row,
                        const std::string &col_name) const
        {
            int idx = col(col_name);
            if (idx < 0 || static_cast<size_t>(idx) >= row.size())
                return "";
            return row[static_cast<size_t>(idx)];
        }

        // ---- Typed helpers ----

        static bool to_bool(const std::string &s, bool default_val = false)
        {
            if (s.empty())
                return default_val;
            std::string v = to_lower(s);
            return (v == "true" || v == "1" || v == "yes");
        }

        static int to_int(const std::string &s, int default_val = 0)
        {
            if (s.empty())
                return default_val;
            return std::stoi(s);
        }

        static uint32_t to_uint32(const std::string &s, uint32_t default_val = 0)
        {
            if (s.empty())
                return default_val;
            // supports hex (0x...)
            return static_cast<uint32_t>(std::stoul(s, nullptr, 0));
        }

        static double to_double(const std::string &s, double default_val = 0.0)
        {
            if (s.empty())
                return default_val;
            // supports scientific notation (1.00E-07)
            return std::stod(s);
        }

        static std::string to_lower(const std::string &s)
        {
            std::string out;
            out.reserve(s.size());
            for (char c : s)
                out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            return out;
        }

        static void trim_inplace(std::string &s)
        {
            size_t b = 0;
            while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
                b++;
            size_t e = s.size();
            while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
                e--;
            s = s.substr(b, e - b);
        }

    private:
        static bool is_blank(const std::string &s)
        {
            for (char c : s)
                if (!std::isspace(static_cast<unsigned char>(c)))
                    return false;
            return true;
        }

        static void strip_cr(std::string &s)
        {
            if (!s.empty() && s.back() == '\r')
                s.pop_back();
        }

        static void strip_bom(std::string &s)
        {
            if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF &&
                static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF)
                s.erase(0, 3);
        }

        std::vector<std::string> parse_line(const std::string &line) const
        {
            std::vector<std::string> fields;
            std::string cur;
            cur.reserve(line.size());

            bool in_quotes = false;
            for (size_t i = 0; i < line.size(); ++i)
            {
                char c = line[i];

                if (in_quotes)
                {
                    if (c == '"')
                    {
                        if (i + 1 < line.size() && line[i + 1] == '"')
                        {
                            cur.push_back('"');
                            ++i;
                        }
                        else
                        {
                            in_quotes = false;
                        }
                    }
                    else
                    {
                        cur.push_back(c);
                    }
                }
                else
                {
                    if (c == '"')
                    {
                        in_quotes = true;
                    }
                    else if (c == delim_)
                    {
                        fields.push_back(cur);
                        cur.clear();
                    }
                    else
                    {
                        cur.push_back(c);
                    }
                }
            }
            fields.push_back(cur);
            return fields;
        }

    private:
        char delim_;
        int line_no_ = 0;
        std::ifstream file_;
        std::vector<std::string> header_;
        std::unordered_map<std::string, int> col_index_;
    };

    // Matching writer: quotes a field only when it contains the delimiter,
    // a quote or a line break.
    class CsvWriter
    {
    public:
        explicit CsvWriter(char delimiter = ',') : delim_(delimiter) {}

        bool open(const std::string &path)
        {
            file_.open(path, std::ios::out | std::ios::trunc);
            return file_.is_open();
        }

        bool is_open() const { return file_.is_open(); }

        void write_row(const std::vector<std::string> &fields)
        {
            for (size_t i = 0; i < fields.size(); ++i)
            {
                if (i > 0)
                    file_ << delim_;
                file_ << escape(fields[i]);
            }
            file_ << '\n';
        }

        void flush() { file_.flush(); }

        void close()
        {
            if (file_.is_open())
                file_.close();
        }

        std::string escape(const std::string &field) const
        {
            bool needs_quotes = false;
            for (char c : field)
            {
                if (c == delim_ || c == '"' || c == '\n' || c == '\r')
                {
                    needs_quotes = true;
                    break;
                }
            }
            if (!needs_quotes)
                return field;

            std::string out = "\"";
            for (char c : field)
            {
                if (c == '"')
                    out.push_back('"');
                out.push_back(c);
            }
            out.push_back('"');
            return out;
        }

    private:
        char delim_;
        std::ofstream file_;
    };

} // namespace utils
