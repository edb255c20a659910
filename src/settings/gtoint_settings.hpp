#ifndef GTOINT_SETTINGS_H
#define GTOINT_SETTINGS_H

#include <string>
#include <optional>

namespace SETTINGS
{
    class gtoint_settings
    {
        private:
            inline static std::string   m_basis_set_path{""};
            inline static std::optional<std::string> m_basis_coord_type; // basis file header if unset
            inline static std::string   m_unit_type{"angstrom"};
            inline static std::string   m_moment_origin{"charge"};
            inline static int           m_moment_order{1};
            inline static int           m_num_threads{0}; // 0, all available
            inline static short         m_verbosity{1};

        public:
            gtoint_settings() = delete;
            gtoint_settings(const gtoint_settings&) = delete;
            gtoint_settings& operator=(const gtoint_settings& other) = delete;
            gtoint_settings(const gtoint_settings&&) = delete;
            gtoint_settings&& operator=(const gtoint_settings&& other) = delete;

            static void set_basis_set_path(const std::string& basis_set_path);
            static void set_basis_coord_type(const std::string& basis_coord_type);
            static void set_unit_type(const std::string& unit);
            static void set_moment_origin(const std::string& origin);
            static void set_moment_order(const int order);
            static void set_num_threads(const int nthreads);
            static void set_verbosity(const short verbosity);

            static const std::string& get_basis_set_path() {return m_basis_set_path;}
            static const std::optional<std::string>& get_basis_coord_type() {return m_basis_coord_type;}
            static const std::string& get_unit_type() {return m_unit_type;}
            static const std::string& get_moment_origin() {return m_moment_origin;}
            static int get_moment_order() {return m_moment_order;}
            static int get_num_threads() {return m_num_threads;}
            static short get_verbosity() {return m_verbosity;}
    };
}

#endif
// GTOINT_SETTINGS_H
