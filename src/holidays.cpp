#include "holidays.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace paycalc {

namespace {

struct FixedHoliday {
    int month;
    int day;
    const char* name;
    int first_year;     // First year the holiday is observed
};

constexpr int ALWAYS = 0;

const std::vector<FixedHoliday>& national_holidays() {
    static const std::vector<FixedHoliday> holidays = {
        {1, 1, "Confraternizacao Universal", ALWAYS},
        {4, 21, "Tiradentes", ALWAYS},
        {5, 1, "Dia do Trabalhador", ALWAYS},
        {9, 7, "Independencia do Brasil", ALWAYS},
        {10, 12, "Nossa Senhora Aparecida", ALWAYS},
        {11, 2, "Finados", ALWAYS},
        {11, 15, "Proclamacao da Republica", ALWAYS},
        {11, 20, "Dia Nacional de Zumbi e da Consciencia Negra", 2024},
        {12, 25, "Natal", ALWAYS},
    };
    return holidays;
}

const std::map<std::string, std::vector<FixedHoliday>>& state_holidays() {
    static const std::map<std::string, std::vector<FixedHoliday>> holidays = {
        {"AC", {{1, 23, "Dia do Evangelico", 2005},
                {3, 8, "Dia Internacional da Mulher", 2002},
                {6, 15, "Aniversario do Acre", 2002},
                {9, 5, "Dia da Amazonia", 2004},
                {11, 17, "Assinatura do Tratado de Petropolis", 2004}}},
        {"AL", {{6, 24, "Sao Joao", ALWAYS},
                {6, 29, "Sao Pedro", ALWAYS},
                {9, 16, "Emancipacao Politica de Alagoas", ALWAYS},
                {11, 20, "Consciencia Negra", ALWAYS}}},
        {"AM", {{9, 5, "Elevacao do Amazonas a Categoria de Provincia", ALWAYS},
                {11, 20, "Consciencia Negra", 2010}}},
        {"AP", {{3, 19, "Sao Jose", ALWAYS},
                {7, 25, "Sao Tiago", ALWAYS},
                {10, 5, "Criacao do Estado", ALWAYS},
                {11, 20, "Consciencia Negra", 2008}}},
        {"BA", {{7, 2, "Independencia da Bahia", ALWAYS}}},
        {"CE", {{3, 19, "Sao Jose", ALWAYS},
                {3, 25, "Data Magna do Ceara", ALWAYS}}},
        {"DF", {{4, 21, "Fundacao de Brasilia", ALWAYS},
                {11, 30, "Dia do Evangelico", ALWAYS}}},
        {"ES", {{10, 28, "Dia do Servidor Publico", ALWAYS}}},
        {"GO", {{10, 28, "Dia do Servidor Publico", ALWAYS}}},
        {"MA", {{7, 28, "Adesao do Maranhao a Independencia do Brasil", ALWAYS}}},
        {"MG", {{4, 21, "Data Magna de Minas Gerais", ALWAYS}}},
        {"MS", {{10, 11, "Criacao do Estado", ALWAYS}}},
        {"MT", {{11, 20, "Consciencia Negra", 2003}}},
        {"PA", {{8, 15, "Adesao do Grao-Para a Independencia do Brasil", ALWAYS}}},
        {"PB", {{8, 5, "Fundacao do Estado", ALWAYS}}},
        {"PE", {{3, 6, "Revolucao Pernambucana", 2008},
                {6, 24, "Sao Joao", ALWAYS}}},
        {"PI", {{10, 19, "Dia do Piaui", ALWAYS}}},
        {"PR", {{12, 19, "Emancipacao do Parana", ALWAYS}}},
        {"RJ", {{4, 23, "Dia de Sao Jorge", ALWAYS},
                {11, 20, "Consciencia Negra", 2002}}},
        {"RN", {{6, 29, "Sao Pedro", ALWAYS},
                {10, 3, "Martires de Cunhau e Uruacu", 2007}}},
        {"RO", {{1, 4, "Criacao do Estado", ALWAYS},
                {6, 18, "Dia do Evangelico", 2002}}},
        {"RR", {{10, 5, "Criacao de Roraima", ALWAYS}}},
        {"RS", {{9, 20, "Revolucao Farroupilha", ALWAYS}}},
        {"SC", {{8, 11, "Criacao da Capitania", ALWAYS},
                {11, 25, "Dia de Santa Catarina", ALWAYS}}},
        {"SE", {{7, 8, "Autonomia Politica de Sergipe", ALWAYS}}},
        {"SP", {{7, 9, "Revolucao Constitucionalista de 1932", ALWAYS}}},
        {"TO", {{9, 8, "Nossa Senhora da Natividade", ALWAYS},
                {10, 5, "Criacao do Estado", ALWAYS}}},
    };
    return holidays;
}

std::string normalize_region(const std::string& region) {
    std::string code = region;
    std::transform(code.begin(), code.end(), code.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return code;
}

void add_fixed(std::set<Date>& out, int year, const std::vector<FixedHoliday>& holidays) {
    for (const auto& h : holidays) {
        if (year >= h.first_year) {
            out.insert(Date(year, h.month, h.day));
        }
    }
}

Date shift_days(const Date& date, int delta) {
    int y = date.year;
    int m = date.month;
    int d = date.day + delta;
    while (d < 1) {
        if (--m < 1) {
            m = 12;
            --y;
        }
        d += days_in_month(y, m);
    }
    while (d > days_in_month(y, m)) {
        d -= days_in_month(y, m);
        if (++m > 12) {
            m = 1;
            ++y;
        }
    }
    return Date(y, m, d);
}

} // anonymous namespace

Date easter_sunday(int year) {
    // Anonymous Gregorian algorithm (Meeus/Jones/Butcher)
    int a = year % 19;
    int b = year / 100;
    int c = year % 100;
    int d = b / 4;
    int e = b % 4;
    int f = (b + 8) / 25;
    int g = (b - f + 1) / 3;
    int h = (19 * a + b - d - g + 15) % 30;
    int i = c / 4;
    int k = c % 4;
    int l = (32 + 2 * e + 2 * i - h - k) % 7;
    int m = (a + 11 * h + 22 * l) / 451;
    int month = (h + l - 7 * m + 114) / 31;
    int day = (h + l - 7 * m + 114) % 31 + 1;
    return Date(year, month, day);
}

std::set<Date> BrazilHolidayProvider::holidays_for(int year, const std::string& region) const {
    const std::string code = normalize_region(region);
    auto state = state_holidays().find(code);
    if (state == state_holidays().end()) {
        throw InvalidRegionError(region);
    }

    std::set<Date> result;
    add_fixed(result, year, national_holidays());

    // Sexta-feira Santa
    result.insert(shift_days(easter_sunday(year), -2));

    add_fixed(result, year, state->second);
    return result;
}

bool BrazilHolidayProvider::supports(const std::string& region) {
    return state_holidays().count(normalize_region(region)) > 0;
}

std::vector<std::string> BrazilHolidayProvider::supported_regions() {
    std::vector<std::string> regions;
    regions.reserve(state_holidays().size());
    for (const auto& [code, holidays] : state_holidays()) {
        regions.push_back(code);
    }
    return regions;
}

} // namespace paycalc
