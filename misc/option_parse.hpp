#ifndef __PERRON_MISC_OPTION_PARSE_HPP__
#define __PERRON_MISC_OPTION_PARSE_HPP__

// STL
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Boost
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/tokenizer.hpp>

namespace perron { namespace command_line {

namespace po = boost::program_options;

// Simple class to store general information about a group of options
class option_traits {
public:
    option_traits(bool required=false,
                  bool positional=false,
                  const std::string& group_name="")
        : _default_requirement(required),
          _default_positional(positional),
          _group_name(group_name) {}

    void required(bool required) { _default_requirement = required; }
    void positional(bool positional) { _default_positional = positional; }
    void group_name(const std::string& name) { _group_name = name; }

    bool required() const { return _default_requirement; }
    bool positional() const { return _default_positional; }
    bool has_group() const { return !_group_name.empty(); }
    const std::string& group_name() const { return _group_name; }

protected:
    bool         _default_requirement;
    bool         _default_positional;
    std::string  _group_name;
};

// symbol used in the usage string for a value of a given type
template<typename T>
struct value_symbol {
    static std::string name() { return "arg"; }
};

#define LIST_OF_SYMBOL_MAPPED_TYPES \
    X(short,          "short"); \
    X(unsigned short, "ushort"); \
    X(int,            "int"); \
    X(unsigned int,   "uint"); \
    X(long,           "long"); \
    X(unsigned long,  "ulong"); \
    X(float,          "float"); \
    X(double,         "double"); \
    X(std::string,    "string");

#define X(type, typestr) \
    template<> \
    struct value_symbol<type> { \
        static std::string name() { return typestr; } \
    }
    LIST_OF_SYMBOL_MAPPED_TYPES
#undef X

/** option_parser: command line parser built on boost::program_options
    with a simplified interface:
    - options are registered together with the variable receiving
      their value and an optional initial value
    - options are organized in groups sharing requirement and
      positional traits
    - built-in support for fixed-size arrays (add_tuple)
    - POSIX-like usage message
    Parsing errors are reported as std::runtime_error.
 */
class option_parser {
    typedef po::options_description          option_group;
    typedef std::shared_ptr<option_group>    group_ptr;
    typedef std::string                      str_t;

public:
    option_parser(const str_t& program_name,
                  const str_t& synopsis,
                  const str_t& default_section_title="Default Options",
                  size_t line_length=po::options_description::m_default_line_length);

    // Add a parameter without initial value
    template<typename _Type>
    void add_value(const str_t& name, _Type& variable,
                   const str_t& description,
                   const option_traits& traits=option_traits(false),
                   const str_t& symbol="");

    // Add and initialize parameter
    template<typename _Type, typename _CompatibleType = _Type>
    void add_value(const str_t& name, _Type& variable,
                   const _CompatibleType& value,
                   const str_t& description,
                   const option_traits& traits=option_traits(false),
                   const str_t& symbol="");

    // Add boolean flag (always optional and non-positional)
    void add_flag(const str_t& name, bool& variable,
                  const str_t& description,
                  const option_traits& traits=option_traits(false));

    // Add and initialize fixed-size random access container
    // (e.g., std::array) taking exactly N values
    template<size_t N, typename _Tuple,
             typename _Type = typename _Tuple::value_type>
    void add_tuple(const str_t& name,
                   _Tuple& variable,
                   const _Tuple& value,
                   const str_t& description,
                   const option_traits& traits=option_traits(false),
                   const str_t& symbol="");

    // Parse command line options. Returns false if help was requested,
    // in which case the usage message has been printed to os.
    bool parse(int argc, const char* argv[], std::ostream& os=std::cout);

    // Print selected aspects of the help message
    str_t print_self(bool with_synopsis=true,
                     bool with_usage=true,
                     bool with_options=true) const;

    const str_t& program_name() const { return _program_name; }

private:
    typedef po::positional_options_description positionals_type;

    std::vector<group_ptr>  _groups;
    std::map<str_t, size_t> _group_map;
    positionals_type        _positionals;
    str_t                   _program_name;
    str_t                   _synopsis;
    str_t                   _flags_string;
    std::vector<str_t>      _options_string;
    std::vector<str_t>      _positionals_string;
    size_t                  _line_length;
    int                     _current_position;

    // returns usage description where each line does not exceed
    // _line_length-1 characters
    str_t usage(size_t indent=4) const;

    // returns shortest valid name of an option (with optional dash)
    str_t short_form(const str_t& name, bool with_dash=false) const;

    template<typename _Type>
    str_t parameter_string(const str_t& s, int N=1) const;

    void add_flag_to_usage_string(const str_t& name);
    void add_option_to_usage_string(const str_t& name,
                                    const str_t& symbol,
                                    bool required, bool positional);

    group_ptr get_group(const option_traits& traits);

    void register_positional(const str_t& name, int N=1);

    // reflow a paragraph and apply prescribed indentation
    str_t reflow(const str_t& s, size_t indent=0) const;
};

inline std::ostream& operator<<(std::ostream& oss, const option_parser& parser) {
    oss << parser.print_self();
    return oss;
}

} // command_line
} // perron

inline perron::command_line::option_parser::
option_parser(const str_t& program_name,
              const str_t& synopsis,
              const str_t& default_section_title,
              size_t line_length)
    : _groups(), _positionals(), _synopsis(synopsis),
      _line_length(line_length), _current_position(0) {

    boost::filesystem::path p(program_name);
    _program_name = p.filename().string();

    // general options live in the first group
    _groups.push_back(std::make_shared<option_group>(default_section_title, _line_length));
    _groups.back()->add_options()("help,h", "Print this message");
    _group_map[default_section_title] = 0;
    _flags_string += "-h";
}

inline std::string perron::command_line::option_parser::
print_self(bool with_synopsis, bool with_usage, bool with_options) const {
    std::ostringstream oss;
    if (with_synopsis)
        oss << reflow(_program_name + ": " + _synopsis) << "\n\n";
    if (with_usage)
        oss << usage() << "\n\n";
    if (with_options) {
        for (size_t i=0 ; i<_groups.size() ; ++i) {
            oss << *_groups[i] << '\n';
        }
    }
    return oss.str();
}

inline void perron::command_line::option_parser::
register_positional(const str_t& name, int N) {
    _current_position += N;
    _positionals.add(name.substr(0, name.find(',')).c_str(), N);
}

inline std::string perron::command_line::option_parser::
reflow(const str_t& str, size_t indent) const {
    typedef boost::char_separator<char>    separator_t;
    typedef boost::tokenizer<separator_t>  tokenizer_t;

    separator_t sep(" ");
    tokenizer_t tokens(str, sep);

    str_t indent_str(indent, ' ');

    std::ostringstream oss;
    size_t line_length = 0;
    for (tokenizer_t::iterator it=tokens.begin() ; it!=tokens.end(); ++it) {
        if (it == tokens.begin()) {
            oss << *it;
            line_length += it->size();
        }
        else if (it->size() + line_length + 1 < _line_length) {
            oss << " " << *it;
            line_length += it->size() + 1;
        }
        else {
            oss << '\n' << indent_str << *it;
            line_length = it->size() + indent;
        }
    }
    return oss.str();
}

inline std::string perron::command_line::option_parser::
usage(size_t indent) const {
    str_t indent_str(indent, ' ');

    std::ostringstream oss;
    oss << "Usage: " << _program_name << " [" << _flags_string << "]";
    size_t length = 8 + _program_name.size() + _flags_string.size() + 3;
    std::vector<str_t> items(_options_string);
    items.insert(items.end(), _positionals_string.begin(), _positionals_string.end());
    for (size_t i=0 ; i<items.size() ; ++i) {
        const str_t& item = items[i];
        if (item.size() + length + 1 < _line_length) {
            oss << " " << item;
            length += item.size() + 1;
        }
        else {
            oss << '\n' << indent_str << item;
            length = item.size() + indent;
        }
    }
    return oss.str();
}

// "-c" if c is the one-character short name of the option,
// "--name" otherwise
inline std::string perron::command_line::option_parser::
short_form(const str_t& name, bool with_dash) const {
    size_t n = name.find(',');
    if (n != str_t::npos && n+1 < name.size()) {
        return (with_dash ? "-" : "") + name.substr(n+1);
    }
    else {
        return (with_dash ? "--" : "") + name.substr(0, n);
    }
}

template<typename _Type>
inline std::string perron::command_line::option_parser::
parameter_string(const str_t& s, int N) const {
    str_t sym = s.empty() ? "<" + value_symbol<_Type>::name() + ">" : s;
    if (N == 1) return sym;
    str_t r = sym;
    for (int i=1 ; i<N ; ++i) {
        r += " " + sym;
    }
    return r;
}

inline void perron::command_line::option_parser::
add_flag_to_usage_string(const str_t& name) {
    str_t s = short_form(name, false);
    if (s.size() == 1) _flags_string += s;
    else _options_string.push_back("[" + short_form(name, true) + "]");
}

inline void perron::command_line::option_parser::
add_option_to_usage_string(const str_t& name,
                           const str_t& val_str,
                           bool required, bool positional) {
    str_t opt_str = short_form(name, true) + " " + val_str;
    str_t form_str = positional ? val_str + "|" + opt_str : opt_str;
    str_t usage_str = required ? form_str : "[" + form_str + "]";
    if (positional) _positionals_string.push_back(usage_str);
    else _options_string.push_back(usage_str);
}

inline perron::command_line::option_parser::group_ptr
perron::command_line::option_parser::
get_group(const option_traits& traits) {
    if (!traits.has_group()) return _groups[0];
    const str_t& name = traits.group_name();
    std::map<str_t, size_t>::const_iterator it = _group_map.find(name);
    if (it != _group_map.end()) {
        return _groups[it->second];
    }
    _groups.push_back(std::make_shared<option_group>(name, _line_length));
    _group_map[name] = _groups.size()-1;
    return _groups.back();
}

template<typename _Type>
inline void perron::command_line::option_parser::
add_value(const str_t& name, _Type& variable,
          const str_t& description,
          const option_traits& traits,
          const str_t& symbol) {

    const str_t s = parameter_string<_Type>(symbol);
    po::typed_value<_Type>* semantic = po::value<_Type>(&variable)->value_name(s);
    if (traits.required()) semantic->required();
    get_group(traits)->add_options()(name.c_str(), semantic, description.c_str());
    add_option_to_usage_string(name, s, traits.required(), traits.positional());
    if (traits.positional()) register_positional(name);
}

template<typename _Type, typename _CompatibleType>
inline void perron::command_line::option_parser::
add_value(const str_t& name, _Type& variable,
          const _CompatibleType& value, const str_t& description,
          const option_traits& traits,
          const str_t& symbol) {

    _Type init_value = static_cast<_Type>(value);
    variable = init_value;
    const str_t s = parameter_string<_Type>(symbol);
    po::typed_value<_Type>* semantic =
        po::value<_Type>(&variable)->value_name(s)->default_value(init_value);
    if (traits.required()) semantic->required();
    get_group(traits)->add_options()(name.c_str(), semantic, description.c_str());
    add_option_to_usage_string(name, s, traits.required(), traits.positional());
    if (traits.positional()) register_positional(name);
}

inline void perron::command_line::option_parser::
add_flag(const str_t& name, bool& variable,
         const str_t& description,
         const option_traits& traits) {

    variable = false;
    get_group(traits)->add_options()(
        name.c_str(), po::bool_switch(&variable), description.c_str()
    );
    add_flag_to_usage_string(name);
}

// program_options has no notion of fixed-size sequences: the values
// are collected in a vector and copied into the tuple on notification,
// once their number has been checked.
template<size_t N, typename _Tuple, typename _Type>
inline void perron::command_line::option_parser::
add_tuple(const str_t& name, _Tuple& variable,
          const _Tuple& value, const str_t& description,
          const option_traits& traits,
          const str_t& symbol) {

    std::vector<_Type> init_value(N);
    str_t value_as_string;
    for (size_t i=0 ; i<N ; ++i) {
        variable[i] = value[i];
        init_value[i] = value[i];
        value_as_string += boost::lexical_cast<str_t>(value[i]);
        if (i < N-1) value_as_string += " ";
    }

    const str_t opt_name = short_form(name, true);
    _Tuple* target = &variable;
    const str_t s = parameter_string<_Type>(symbol, N);
    po::typed_value<std::vector<_Type> >* semantic =
        po::value<std::vector<_Type> >()->value_name(s)
        ->default_value(init_value, value_as_string)
        ->multitoken()
        ->notifier([target, opt_name](const std::vector<_Type>& v) {
            if (v.size() != N) {
                std::ostringstream os;
                os << "option " << opt_name << " expects exactly " << N
                   << " values (" << v.size() << " given)";
                throw po::error(os.str());
            }
            for (size_t i=0 ; i<N ; ++i) (*target)[i] = v[i];
        });
    if (traits.required()) semantic->required();
    get_group(traits)->add_options()(name.c_str(), semantic, description.c_str());
    add_option_to_usage_string(name, s, traits.required(), traits.positional());
    if (traits.positional()) register_positional(name, N);
}

inline bool perron::command_line::
option_parser::parse(int argc, const char* argv[], std::ostream& os) {
    // consolidate all option groups into a single overall group
    option_group all_options(_line_length);
    for (size_t i=0 ; i<_groups.size() ; ++i) {
        all_options.add(*_groups[i]);
    }

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv).
            options(all_options).
            positional(_positionals).run(),
            vm
        );

        if (vm.count("help")) {
            os << print_self() << '\n';
            return false;
        }
        po::notify(vm);
    }
    catch(po::error& e) {
        throw std::runtime_error("error while parsing command line options for " +
                                 _program_name + ": " + e.what());
    }
    return true;
}

#endif // __PERRON_MISC_OPTION_PARSE_HPP__
