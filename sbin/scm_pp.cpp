/*
 * SCMGrid: Gridded Runs of a Single Column Model
 * Copyright (c) 2026 by the SCMGrid developers
 * 
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * 
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 * 
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstdio>
#include <exception>
#include <iostream>
#include <string>
#include <tclap/CmdLine.h>
#include <everytrace.h>

#include <scmgrid/error.hpp>
#include <scmgrid/JobConfig.hpp>
#include <scmgrid/Job.hpp>
#include <scmgrid/openifs/ModelSpec_OpenIFS.hpp>

using namespace scmgrid;

struct ParseArgs {
    std::string config_fname;
    JobOptions opts;

    ParseArgs(int argc, char **argv);
};

ParseArgs::ParseArgs(int argc, char **argv)
{
    try {
        TCLAP::CmdLine cmd("Assembles the archived per-cell output of a "
            "gridded single column model run into one file", ' ', scmgrid::version);

        TCLAP::UnlabeledValueArg<std::string> config_a("config",
            "Job configuration file (INI) of the run",
            true, "", "config file", cmd);

        TCLAP::ValueArg<int> num_workers_a("n", "num-workers",
            "Number of worker threads",
            false, 1, "workers", cmd);

        TCLAP::SwitchArg delete_a("d", "delete",
            "Delete per-cell files once the grid file is written",
            cmd, false);

        TCLAP::ValueArg<std::string> drop_list_a("", "drop-list",
            "File listing variables to leave out of the grid file",
            false, "dropvars.txt", "file", cmd);

        cmd.parse( argc, argv );

        config_fname = config_a.getValue();
        opts.num_workers = num_workers_a.getValue();
        opts.delete_cell_files = delete_a.getValue();
        opts.drop_list_fname = drop_list_a.getValue();
    } catch (TCLAP::ArgException &e) {
        std::cerr << "error: " << e.error() << " for arg " << e.argId() << std::endl;
        exit(1);
    }
}

int main(int argc, char **argv)
{
    everytrace_init();
    ParseArgs args(argc, argv);

    printf("scm_pp version %s\n", scmgrid::version.c_str());
    try {
        JobConfig const config(read_job_config(args.config_fname));
        Job job(config, openifs::openifs_scm(), args.opts);
        JobSummary const summary(job.post_process());
        printf("Wrote %s\n", summary.output_fname.c_str());
    } catch(scmgrid::Exception const &) {
        return 1;
    } catch(std::exception const &exp) {
        fprintf(stderr, "Fatal error: %s\n", exp.what());
        return 1;
    }
    return 0;
}
