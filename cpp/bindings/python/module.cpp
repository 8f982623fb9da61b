#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <gmpxx.h>

#include "cr/cr.hpp"
#include "cr/lattice.hpp"

namespace py = pybind11;

static py::int_ to_py_int(const mpz_class& v) {
  const std::string hex = v.get_str(16);
  PyObject* obj = PyLong_FromString(hex.c_str(), nullptr, 16);
  if (!obj) throw py::error_already_set();
  return py::reinterpret_steal<py::int_>(obj);
}

static mpz_class from_py_int(const py::int_& v) {
  return mpz_class(py::str(v).cast<std::string>(), 10);
}

static py::dict find_prime_py(int bits, int iterations, bool enhanced, bool safe,
                              std::uint64_t max_attempts) {
  cr::PrimeConfig cfg;
  cfg.bits = bits;
  cfg.iterations = iterations;
  cfg.enhanced = enhanced;
  cfg.safe = safe;
  cfg.budget.max_attempts = max_attempts;

  // Release the GIL for the search.
  cr::PrimeResult res;
  {
    py::gil_scoped_release nogil;
    res = cr::find_prime(cfg);
  }

  py::dict out;
  out["value"] = to_py_int(res.value);
  out["attempts"] = py::int_(res.attempts);
  out["ns_elapsed"] = py::int_(res.ns_elapsed);
  out["engine_info"] = res.engine_info;
  return out;
}

template <class F> static py::int_ released(F&& f) {
  mpz_class v;
  {
    py::gil_scoped_release nogil;
    v = f();
  }
  return to_py_int(v);
}

PYBIND11_MODULE(crcore, m) {
  m.doc() = "cryptorand core (pybind11)";
  m.attr("__version__") = cr::CR_VERSION;

  py::register_exception<cr::invalid_bit_length>(m, "InvalidBitLength", PyExc_ValueError);
  py::register_exception<cr::invalid_parameter>(m, "InvalidParameter", PyExc_ValueError);
  py::register_exception<cr::no_inverse>(m, "NoInverse", PyExc_ValueError);
  py::register_exception<cr::no_table_for_sigma>(m, "NoTableForSigma", PyExc_ValueError);
  py::register_exception<cr::entropy_unavailable>(m, "EntropyUnavailable", PyExc_RuntimeError);
  py::register_exception<cr::search_exhausted>(m, "SearchExhausted", PyExc_RuntimeError);

  m.def("rand_big_int", [](int bits) { return released([&] { return cr::rand_big_int(bits); }); },
        py::arg("bits"));

  m.def("rand_prime",
        [](int bits, int iterations, bool enhanced) {
          return released([&] { return cr::rand_prime(bits, iterations, enhanced); });
        },
        py::arg("bits"), py::arg("iterations") = 20, py::arg("enhanced") = false);

  m.def("rand_safe_prime",
        [](int bits, int iterations, bool enhanced) {
          return released([&] { return cr::rand_safe_prime(bits, iterations, enhanced); });
        },
        py::arg("bits"), py::arg("iterations") = 20, py::arg("enhanced") = false);

  m.def("find_prime", &find_prime_py,
        py::arg("bits"), py::arg("iterations") = 20, py::arg("enhanced") = false,
        py::arg("safe") = false, py::arg("max_attempts") = 0,
        R"pbdoc(
Search for a probable (safe) prime.

Returns:
  dict { value, attempts, ns_elapsed, engine_info }.
)pbdoc");

  m.def("is_probable_prime",
        [](const py::int_& n, int k, bool enhanced) {
          mpz_class v = from_py_int(n);
          py::gil_scoped_release nogil;
          return cr::is_probable_prime(v, k, cr::system_entropy(), enhanced);
        },
        py::arg("n"), py::arg("k") = 20, py::arg("enhanced") = false);

  m.def("constant_time_compare",
        [](const py::bytes& a, const py::bytes& b) {
          return cr::constant_time_compare(std::string(a), std::string(b));
        },
        py::arg("a"), py::arg("b"));

  m.def("generate_primes_up_to", &cr::generate_primes_up_to, py::arg("limit"));

  m.def("discrete_gaussian_sample",
        [](double sigma) { return cr::discrete_gaussian_sample(sigma); },
        py::arg("sigma") = 3.2);

  m.def("rand_lattice",
        [](std::size_t dimension, std::uint32_t modulus, double sigma, bool normalized) {
          return cr::rand_lattice(dimension, modulus, sigma,
                                  normalized ? cr::LatticeOutput::normalized
                                             : cr::LatticeOutput::integer);
        },
        py::arg("dimension") = 512, py::arg("modulus") = 12289, py::arg("sigma") = 3.2,
        py::arg("normalized") = false,
        R"pbdoc(One LWE-style sample; an integer residue or, when normalized, a float in [0, 1).)pbdoc");
}
