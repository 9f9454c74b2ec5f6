
#include "helper.h"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;



vector<string> split_string(const string& input, char delimiter) {
    vector<string> elements;
    stringstream strstr(input);
    string token;
    while (getline(strstr, token, delimiter)) {
        elements.push_back(token);
    }
    // getline does not return a trailing empty field
    if (!input.empty() && input.back() == delimiter)
        elements.push_back("");
    return elements;
}


string trim_string(const string& input) {
    size_t start = 0;
    size_t end   = input.size();
    while (start < end && isspace(static_cast<unsigned char>(input[start])))
        start++;
    while (end > start && isspace(static_cast<unsigned char>(input[end - 1])))
        end--;
    return input.substr(start, end - start);
}


vector<double> parse_double_list(const string& input) {
    vector<double> values;
    for (const string& raw : split_string(input, ',')) {
        string token = trim_string(raw);
        if (token.empty())
            continue;
        size_t n_parsed = 0;
        double value = stod(token, &n_parsed);
        if (n_parsed != token.size())
            throw invalid_argument("'" + token + "' is not a number");
        values.push_back(value);
    }
    return values;
}

