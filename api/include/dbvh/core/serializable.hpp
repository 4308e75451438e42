#pragma once

#include <string>
#include <vector>
#include <array>
#include <map>
#include <unordered_map>
#include <optional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <functional>
#include <nlohmann/json.hpp>

namespace dbvh {

    /**
     * @brief JSON field registry for plain settings structs.
     *
     * Fields are registered once per type through pointers to members, so
     * copies and moves of the derived object stay valid. The derived type
     * provides `static void DescribeFields()` which calls RegisterField().
     *
     * @code
     * struct Settings : Serializable<Settings> {
     *     int count = 4;
     *     static void DescribeFields() { RegisterField("count", &Settings::count); }
     * };
     * @endcode
     */
    template <typename Derived>
    class Serializable {
    public:
        // Serializa todos os campos para JSON
        nlohmann::json Serialize() const {
            nlohmann::json j = nlohmann::json::object();
            for (const auto& field : fields()) {
                j[field.name] = field.getter(self());
            }
            return j;
        }

        /// Campos ausentes mantêm o valor atual; campos desconhecidos são ignorados.
        void Deserialize(const nlohmann::json& j) {
            for (const auto& field : fields()) {
                if (j.contains(field.name)) {
                    field.setter(self(), j.at(field.name));
                }
            }
        }

    protected:
        // --------------------------
        // Registro de campos
        // --------------------------
        template <typename T>
        static void RegisterField(const std::string& name, T Derived::* member) {
            table().push_back(Field{
                name,
                [member](const Derived& obj) -> nlohmann::json { return SerializeField(obj.*member); },
                [member](Derived& obj, const nlohmann::json& j) { DeserializeField(obj.*member, j); }
            });
        }

        // --------------------------
        // Serialização genérica
        // --------------------------
        template <typename T>
        static nlohmann::json SerializeField(const T& value) {
            if constexpr (is_serializable<T>::value) {
                return value.Serialize();
            } else if constexpr (is_vector<T>::value || is_array<T>::value) {
                nlohmann::json arr = nlohmann::json::array();
                for (const auto& el : value) {
                    arr.push_back(SerializeField(el));
                }
                return arr;
            } else if constexpr (is_map<T>::value || is_unordered_map<T>::value) {
                nlohmann::json obj = nlohmann::json::object();
                for (const auto& [k, v] : value) {
                    obj[k] = SerializeField(v);
                }
                return obj;
            } else if constexpr (is_optional<T>::value) {
                if (value.has_value()) return SerializeField(*value);
                else return nullptr;
            } else {
                return value;
            }
        }

        template <typename T>
        static void DeserializeField(T& field, const nlohmann::json& j) {
            if constexpr (is_serializable<T>::value) {
                field.Deserialize(j);
            } else if constexpr (is_vector<T>::value) {
                field.clear();
                for (const auto& el : j) {
                    typename T::value_type tmp;
                    DeserializeField(tmp, el);
                    field.push_back(std::move(tmp));
                }
            } else if constexpr (is_array<T>::value) {
                size_t idx = 0;
                for (const auto& el : j) {
                    if (idx >= field.size()) break;
                    DeserializeField(field[idx++], el);
                }
            } else if constexpr (is_map<T>::value || is_unordered_map<T>::value) {
                field.clear();
                for (auto it = j.begin(); it != j.end(); ++it) {
                    typename T::mapped_type tmp;
                    DeserializeField(tmp, it.value());
                    field[it.key()] = std::move(tmp);
                }
            } else if constexpr (is_optional<T>::value) {
                if (j.is_null()) field.reset();
                else {
                    typename T::value_type tmp;
                    DeserializeField(tmp, j);
                    field = std::move(tmp);
                }
            } else {
                field = j.get<T>();
            }
        }

    private:
        struct Field {
            std::string name;
            std::function<nlohmann::json(const Derived&)> getter;
            std::function<void(Derived&, const nlohmann::json&)> setter;
        };

        const Derived& self() const { return static_cast<const Derived&>(*this); }
        Derived& self() { return static_cast<Derived&>(*this); }

        static std::vector<Field>& table() {
            static std::vector<Field> s_fields;
            return s_fields;
        }

        // Registro feito uma única vez por tipo, mesmo com várias threads
        static const std::vector<Field>& fields() {
            static std::once_flag s_once;
            std::call_once(s_once, [] { Derived::DescribeFields(); });
            return table();
        }

        // --------------------------
        // Traits auxiliares
        // --------------------------
        template<typename T> struct is_serializable : std::is_base_of<Serializable<T>, T> {};

        template<typename T> struct is_vector : std::false_type {};
        template<typename... Args> struct is_vector<std::vector<Args...>> : std::true_type {};

        template<typename T> struct is_array : std::false_type {};
        template<typename U, std::size_t N> struct is_array<std::array<U, N>> : std::true_type {};

        template<typename T> struct is_map : std::false_type {};
        template<typename... Args> struct is_map<std::map<Args...>> : std::true_type {};

        template<typename T> struct is_unordered_map : std::false_type {};
        template<typename... Args> struct is_unordered_map<std::unordered_map<Args...>> : std::true_type {};

        template<typename T> struct is_optional : std::false_type {};
        template<typename... Args> struct is_optional<std::optional<Args...>> : std::true_type {};
    };

} // namespace dbvh
