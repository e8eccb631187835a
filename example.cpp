/*
 * hybridsort usage examples
 */

#include <iostream>
#include <vector>
#include <chrono>
#include <random>
#include <algorithm>
#include <string>
#include <cstdio>
#include "include/hybridsort.hpp"

using namespace std;
using namespace std::chrono;

struct Person {
    string name;
    int age = 0;
};

int main() {
    cout << "=== hybridsort Examples ===" << endl << endl;

    // Example 1: Basic usage with vector
    {
        cout << "1. Basic usage:" << endl;
        vector<int> data = {5, 2, 8, 1, 9, 3, 7, 4, 6};

        cout << "   Before: ";
        for (int x : data) cout << x << " ";
        cout << endl;

        hybrid::sort(data.begin(), data.end());

        cout << "   After:  ";
        for (int x : data) cout << x << " ";
        cout << endl << endl;
    }

    // Example 2: Custom comparator, any element type
    {
        cout << "2. Custom comparator:" << endl;

        vector<string> words = {"pear", "fig", "banana", "kiwi", "apple"};
        hybrid::sort(words.begin(), words.end(),
                     [](const string& a, const string& b) { return a.size() < b.size(); });
        cout << "   by length: ";
        for (const auto& w : words) cout << w << " ";
        cout << endl;

        vector<double> doubles = {3.14159, -2.71828, 1.41421};
        hybrid::sort(doubles.begin(), doubles.end(), greater<double>());
        cout << "   descending: ";
        for (double x : doubles) cout << x << " ";
        cout << endl << endl;
    }

    // Example 3: Stable sort keeps equal keys in input order
    {
        cout << "3. Stable sort by age:" << endl;
        vector<Person> people = {
            {"Ada", 36}, {"Brian", 25}, {"Carol", 36}, {"Dan", 25}, {"Eve", 30}};

        hybrid::stable_sort(people.begin(), people.end(),
                            [](const Person& a, const Person& b) { return a.age < b.age; });

        for (const auto& p : people) cout << "   " << p.age << " " << p.name << endl;
        cout << endl;
    }

    // Example 4: Pre-allocated buffer (zero allocation during sort)
    {
        cout << "4. Zero-allocation stable sort with buffer:" << endl;
        vector<int> data = {5, 2, 8, 1, 9};
        vector<int> buffer(data.size());  // Reusable buffer

        hybrid::stable_sort(data.begin(), data.end(), buffer.data());

        cout << "   Sorted: ";
        for (int x : data) cout << x << " ";
        cout << endl << endl;
    }

    // Example 5: Order statistics
    {
        cout << "5. Median without a full sort:" << endl;
        vector<int> data = {7, 2, 9, 4, 1};

        hybrid::partition_by_rank(data.begin(), data.end(), data.size() / 2);

        cout << "   median = " << data[data.size() / 2] << "  (";
        for (int x : data) cout << x << " ";
        cout << ")" << endl << endl;
    }

    // Example 6: Performance comparison
    {
        cout << "6. Performance comparison (n=100,000):" << endl;

        mt19937 rng(42);
        uniform_int_distribution<int> dist(0, 1000000);

        vector<int> original(100000);
        for (int& x : original) x = dist(rng);

        vector<int> data = original;

        // std::sort
        auto start = high_resolution_clock::now();
        sort(data.begin(), data.end());
        auto end = high_resolution_clock::now();
        double t_std = duration<double, micro>(end - start).count();

        // hybridsort
        data = original;
        start = high_resolution_clock::now();
        hybrid::sort(data.begin(), data.end());
        end = high_resolution_clock::now();
        double t_hybrid = duration<double, micro>(end - start).count();

        printf("   std::sort:    %.0f us\n", t_std);
        printf("   hybrid::sort: %.0f us (%.2fx)\n", t_hybrid, t_std / t_hybrid);
        cout << endl;
    }

    // Example 7: Few distinct values (duplicate runs are skipped)
    {
        cout << "7. Few distinct values (0-9):" << endl;

        mt19937 rng(42);
        uniform_int_distribution<int> dist(0, 9);

        vector<int> digits(100000);
        for (int& x : digits) x = dist(rng);

        vector<int> data = digits;

        auto start = high_resolution_clock::now();
        sort(data.begin(), data.end());
        auto end = high_resolution_clock::now();
        double t_std = duration<double, micro>(end - start).count();

        data = digits;
        start = high_resolution_clock::now();
        hybrid::sort(data.begin(), data.end());
        end = high_resolution_clock::now();
        double t_hybrid = duration<double, micro>(end - start).count();

        printf("   std::sort:    %.0f us\n", t_std);
        printf("   hybrid::sort: %.0f us (%.2fx)\n", t_hybrid, t_std / t_hybrid);
    }

    return 0;
}
