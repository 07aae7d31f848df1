/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "chroot-manager-api.h"


namespace py = pybind11;
PYBIND11_MODULE(pychrootmanager, m) {
    m.doc() = "Python bindings for libchroot-manager";
    m.def("chroot_manager_enable_log", &chroot_manager_enable_log, py::arg("path"), "Append all log output to a file");
    m.def("chroot_manager_set_verbose", &chroot_manager_set_verbose, py::arg("verbose"), "Print debug messages on the console");
    m.def("chroot_manager_mount_all", &chroot_manager_mount_all, py::arg("jail_root"), "Mount dev, proc, sys, tmp and dev/pts into the jail");
    m.def("chroot_manager_unmount_all", &chroot_manager_unmount_all, py::arg("jail_root"), "Unmount every jail mount, children first");
    m.def("chroot_manager_is_mounted", &chroot_manager_is_mounted, py::arg("path"), "Whether a path is a mount point");
    m.def("chroot_manager_reconcile_logs", &chroot_manager_reconcile_logs, py::arg("log_dir"), py::arg("ignore") = std::vector<std::string>(), "Rename or remove the strace files of a traced session");
    m.def("chroot_manager_normalize_ownership", &chroot_manager_normalize_ownership, py::arg("log_dir"), py::arg("user"), "Hand a log directory over to a user");

    m.def("chroot_manager_get_last_error_code", &chroot_manager_get_last_error_code);
    m.def("chroot_manager_get_last_error_msg", []() -> std::string { return std::string(chroot_manager_get_last_error_msg()); });
}
